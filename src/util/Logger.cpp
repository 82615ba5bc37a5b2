#include "util/Logger.hpp"
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>

namespace tagmv::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open for the whole run
static Logger::Level log_level = Logger::Level::Info;

std::filesystem::path Logger::default_path() {
    if (const char* env = std::getenv("TAGMV_LOG"); env && *env) {
        return env;
    }
    return "/tmp/tagmv.log";
}

void Logger::init(const std::filesystem::path& path, Level min_level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_file.open(path, std::ios::trunc);
    log_level = min_level;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < log_level) return;
    if (!log_file.is_open()) {
        log_file.open(default_path(), std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << std::format("{}{}\n", level_str, message);
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace tagmv::util
