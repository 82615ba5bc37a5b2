#include "ui/ReportPrinter.hpp"
#include "ui/Color.hpp"
#include "core/DestinationPlanner.hpp"
#include <cstdlib>
#include <map>
#include <utility>
#include <unistd.h>
#include <vector>

namespace tagmv::ui {

namespace {
    const Style FOLDER_STYLE{Color::Yellow, Attribute::Bold};
    const Style UNSORTED_STYLE{Color::Red, Attribute::Bold};
    const Style NAME_STYLE{Color::Green, Attribute::None};
    const Style DIM_STYLE{Color::Default, Attribute::Dim};
    const Style ERROR_STYLE{Color::Red, Attribute::Bold};

    // Folder part and file part of a '/'-separated relative path
    std::pair<std::string, std::string> split_destination(const std::string& relative) {
        const size_t slash = relative.rfind('/');
        if (slash == std::string::npos) return {"", relative};
        return {relative.substr(0, slash), relative.substr(slash + 1)};
    }
}

ReportPrinter::ReportPrinter(std::ostream& out, bool use_color)
    : out_(out), use_color_(use_color) {}

bool ReportPrinter::color_wanted(int fd) {
    const char* no_color = std::getenv("NO_COLOR");
    if (no_color && *no_color) return false;
    return isatty(fd) == 1;
}

void ReportPrinter::print_header(const std::string& version, bool execute, const std::filesystem::path& root,
                                 std::size_t file_count) {
    const std::string mode = execute ? "EXECUTING" : "DRY RUN (use --execute to move files)";
    out_ << "tagmv v" << version << " -- " << paint(mode, Style{Color::Default, Attribute::Bold}, use_color_) << "\n\n";
    out_ << "Scanning: " << paint(root.string(), DIM_STYLE, use_color_) << "\n";
    out_ << "Found " << paint(std::to_string(file_count), Style{Color::Default, Attribute::Bold}, use_color_)
         << " audio files\n\n";
}

void ReportPrinter::print_report(const model::Report& report, bool execute) {
    // Rejected entries have no destination; list them under their planned folder
    std::map<std::string, std::vector<const model::MoveOutcome*>> folders;
    for (const auto& outcome : report.outcomes) {
        const auto& move = outcome.move;
        const std::string& dest = move.final_destination.empty() ? move.plan.relative_destination
                                                                 : move.final_destination;
        folders[split_destination(dest).first].push_back(&outcome);
    }

    for (const auto& [folder, outcomes] : folders) {
        if (folder == core::DestinationPlanner::UNSORTED_FOLDER) {
            out_ << "  " << paint(folder, UNSORTED_STYLE, use_color_) << "\n";
        } else {
            out_ << "  " << paint(folder + "/", FOLDER_STYLE, use_color_) << "\n";
        }

        for (const auto* outcome : outcomes) {
            const auto& move = outcome->move;
            const std::string source_name = move.plan.source.path.filename().string();

            if (move.action == model::MoveAction::Skip) {
                out_ << "    " << paint(split_destination(move.final_destination).second, DIM_STYLE, use_color_)
                     << "  " << paint("(already in place)", DIM_STYLE, use_color_) << "\n";
                continue;
            }

            const std::string& dest = move.final_destination.empty() ? move.plan.relative_destination
                                                                     : move.final_destination;
            out_ << "    " << paint(split_destination(dest).second, NAME_STYLE, use_color_) << "  "
                 << paint("<-", DIM_STYLE, use_color_) << " " << paint(source_name, DIM_STYLE, use_color_);
            if (outcome->result == model::MoveResult::Failed) {
                out_ << "  " << paint("FAILED: " + outcome->reason, ERROR_STYLE, use_color_);
            }
            out_ << "\n";
        }
        out_ << "\n";
    }

    const std::size_t skipped = report.skipped_count();
    out_ << "Summary: " << report.total_files << " files -> " << report.folder_count << " folders, "
         << report.unsorted_count << " unsorted";
    if (skipped > 0) {
        out_ << ", " << skipped << " already in place";
    }
    out_ << "\n";

    if (execute) {
        const std::size_t failed = report.failed_count();
        out_ << "\nMoved " << report.moved_count() << " files successfully";
        if (failed > 0) {
            out_ << ", " << paint(std::to_string(failed) + " errors", ERROR_STYLE, use_color_);
        }
        out_ << "\n";
    } else if (report.has_failures()) {
        out_ << paint(std::to_string(report.failed_count()) + " files cannot be placed", ERROR_STYLE, use_color_)
             << "\n";
    }
}

}  // namespace tagmv::ui
