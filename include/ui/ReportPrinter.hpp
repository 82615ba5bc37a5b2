#pragma once

#include "model/Move.hpp"
#include <filesystem>
#include <ostream>
#include <string>

namespace tagmv::ui {

class ReportPrinter {
public:
    ReportPrinter(std::ostream& out, bool use_color);

    // Color is used only for a terminal and when NO_COLOR is unset.
    static bool color_wanted(int fd);

    void print_header(const std::string& version, bool execute, const std::filesystem::path& root,
                      std::size_t file_count);

    // Per-folder listing followed by the summary line(s).
    void print_report(const model::Report& report, bool execute);

private:
    std::ostream& out_;
    bool use_color_;
};

}  // namespace tagmv::ui
