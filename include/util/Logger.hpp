#pragma once

#include <filesystem>
#include <string>

namespace tagmv::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens (truncates) the log file. Without init the first message opens
    // default_path() in append mode.
    static void init(const std::filesystem::path& path, Level min_level = Level::Info);
    static std::filesystem::path default_path();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace tagmv::util
