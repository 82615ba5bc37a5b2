#include "util/FileOps.hpp"

namespace tagmv::util {

namespace fs = std::filesystem;

bool LocalFileOps::exists(const fs::path& path, std::error_code& ec) {
    // symlink_status so a dangling link still counts as occupying the name
    auto status = fs::symlink_status(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
            ec.clear();
        }
        return false;
    }
    return fs::exists(status);
}

void LocalFileOps::create_directories(const fs::path& dir, std::error_code& ec) {
    fs::create_directories(dir, ec);
}

void LocalFileOps::rename(const fs::path& from, const fs::path& to, std::error_code& ec) {
    fs::rename(from, to, ec);
}

void LocalFileOps::copy_file(const fs::path& from, const fs::path& to, std::error_code& ec) {
    fs::copy_file(from, to, fs::copy_options::none, ec);
}

std::uintmax_t LocalFileOps::file_size(const fs::path& path, std::error_code& ec) {
    return fs::file_size(path, ec);
}

void LocalFileOps::remove(const fs::path& path, std::error_code& ec) {
    fs::remove(path, ec);
}

}  // namespace tagmv::util
