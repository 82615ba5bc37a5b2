#include "backend/TagReader.hpp"
#include "config/Options.hpp"
#include "core/BatchOrchestrator.hpp"
#include "ui/ReportPrinter.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/FileOps.hpp"
#include "util/Logger.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

#ifndef TAGMV_VERSION
#define TAGMV_VERSION "0.0.0"
#endif

namespace {
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FAILED = 1;
    constexpr int EXIT_USAGE = 2;
}

int main(int argc, char** argv) {
    namespace fs = std::filesystem;
    using tagmv::util::Logger;

    tagmv::config::Options options;
    try {
        options = tagmv::config::OptionsParser::parse(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const tagmv::config::OptionsError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << tagmv::config::OptionsParser::usage();
        return EXIT_USAGE;
    }

    if (options.show_help) {
        std::cout << tagmv::config::OptionsParser::usage();
        return EXIT_OK;
    }
    if (options.show_version) {
        std::cout << "tagmv " << TAGMV_VERSION << "\n";
        return EXIT_OK;
    }

    try {
        Logger::init(Logger::default_path(), options.verbose ? Logger::Level::Debug : Logger::Level::Info);
        Logger::info(std::string("tagmv ") + TAGMV_VERSION + " starting" + (options.execute ? " (execute)" : " (dry run)"));

        fs::path dir = options.path.empty() ? fs::current_path() : options.path;
        std::error_code ec;
        fs::path root = fs::canonical(dir, ec);
        if (ec) {
            std::cerr << "error: Cannot resolve path " << dir.string() << ": " << ec.message() << "\n";
            Logger::error("Cannot resolve path " + dir.string() + ": " + ec.message());
            return EXIT_FAILED;
        }
        if (!fs::is_directory(root, ec)) {
            std::cerr << "error: Not a directory: " << root.string() << "\n";
            Logger::error("Not a directory: " + root.string());
            return EXIT_FAILED;
        }

        const auto paths = tagmv::util::DirectoryScanner::scan(root, options.recursive);

        tagmv::ui::ReportPrinter printer(std::cout, tagmv::ui::ReportPrinter::color_wanted(STDOUT_FILENO));
        printer.print_header(TAGMV_VERSION, options.execute, root, paths.size());
        if (paths.empty()) {
            return EXIT_OK;
        }

        std::vector<tagmv::model::SourceFile> files;
        files.reserve(paths.size());
        for (const auto& path : paths) {
            files.push_back({path, tagmv::backend::TagReader::read(path.string())});
        }

        tagmv::util::LocalFileOps file_ops;
        tagmv::core::BatchOrchestrator orchestrator(root, file_ops);
        const auto report = orchestrator.run(files, !options.execute);

        printer.print_report(report, options.execute);

        Logger::info("tagmv finished");
        return report.has_failures() ? EXIT_FAILED : EXIT_OK;
    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal error: ") + e.what());
        std::cerr << "error: " << e.what() << "\n";
        return EXIT_FAILED;
    }
}
