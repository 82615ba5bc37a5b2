#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace tagmv::config {

class OptionsError : public std::invalid_argument {
public:
    explicit OptionsError(const std::string& msg) : std::invalid_argument(msg) {}
};

// Settings for a single invocation; nothing here is saved.
struct Options {
    std::filesystem::path path;  // empty = current directory
    bool execute = false;        // default is a dry-run preview
    bool recursive = false;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

class OptionsParser {
public:
    // args excludes argv[0]. Throws OptionsError on unknown flags or extra paths.
    static Options parse(const std::vector<std::string>& args);
    static std::string usage();
};

}  // namespace tagmv::config
