#include "config/Options.hpp"

namespace tagmv::config {

Options OptionsParser::parse(const std::vector<std::string>& args) {
    Options opts;
    bool path_seen = false;
    bool only_positional = false;

    for (const auto& arg : args) {
        if (!only_positional && arg.size() > 1 && arg[0] == '-') {
            if (arg == "--") only_positional = true;
            else if (arg == "--execute") opts.execute = true;
            else if (arg == "-r" || arg == "--recursive") opts.recursive = true;
            else if (arg == "-v" || arg == "--verbose") opts.verbose = true;
            else if (arg == "-h" || arg == "--help") opts.show_help = true;
            else if (arg == "-V" || arg == "--version") opts.show_version = true;
            else throw OptionsError("unknown option '" + arg + "'");
            continue;
        }

        if (path_seen) {
            throw OptionsError("unexpected argument '" + arg + "' (only one PATH is accepted)");
        }
        opts.path = arg;
        path_seen = true;
    }

    return opts;
}

std::string OptionsParser::usage() {
    return "Organize music files by audio tags\n"
           "\n"
           "Usage: tagmv [OPTIONS] [PATH]\n"
           "\n"
           "Arguments:\n"
           "  [PATH]           Directory to sort (defaults to current directory)\n"
           "\n"
           "Options:\n"
           "      --execute    Actually move files (default is dry-run preview)\n"
           "  -r, --recursive  Scan subdirectories\n"
           "  -v, --verbose    Write debug messages to the log file\n"
           "  -h, --help       Print help\n"
           "  -V, --version    Print version\n"
           "\n"
           "Environment:\n"
           "  TAGMV_LOG        Log file (default /tmp/tagmv.log)\n"
           "  NO_COLOR         Disable colored output\n";
}

}  // namespace tagmv::config
