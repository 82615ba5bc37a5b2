#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>

namespace tagmv::util {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;
    int64_t  d_off;
    uint16_t d_reclen;
    uint8_t  d_type;
    char     d_name[];
};

constexpr uint8_t TYPE_UNKNOWN = 0;
constexpr uint8_t TYPE_REG = 8;
constexpr uint8_t TYPE_DIR = 4;
constexpr uint8_t TYPE_LNK = 10;

constexpr const char* UNSORTED_DIR = "_Unsorted";

namespace {
    // Closes the directory descriptor on every exit path
    struct FdGuard {
        int fd;
        ~FdGuard() { if (fd >= 0) close(fd); }
    };
}

bool DirectoryScanner::is_audio_extension(const char* filename) {
    const char* ext = strrchr(filename, '.');
    if (!ext || ext == filename) return false;

    std::string lowered(ext);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (const auto& ae : AUDIO_EXTENSIONS) {
        if (ae == lowered) return true;
    }
    return false;
}

std::vector<std::filesystem::path> DirectoryScanner::scan(const std::filesystem::path& root_dir, bool recursive) {
    // Normalize: strip trailing slashes to prevent // in paths
    std::string root_str = root_dir.string();
    while (root_str.length() > 1 && root_str.back() == '/') {
        root_str.pop_back();
    }
    Logger::info("DirectoryScanner: Scanning " + root_str + (recursive ? " (recursive)" : ""));

    std::vector<std::filesystem::path> files;
    scan_recursive(root_str, recursive, true, files);

    std::sort(files.begin(), files.end());
    Logger::info("DirectoryScanner: Found " + std::to_string(files.size()) + " audio files");
    return files;
}

void DirectoryScanner::scan_recursive(const std::string& dir_path, bool recursive, bool is_root,
                                      std::vector<std::filesystem::path>& files) {
    FdGuard dir{open(dir_path.c_str(), O_RDONLY | O_DIRECTORY)};
    if (dir.fd < 0) {
        const std::string reason = std::strerror(errno);
        if (is_root) {
            throw ScanError("Failed to read directory " + dir_path + ": " + reason);
        }
        Logger::warn("DirectoryScanner: Skipping unreadable directory " + dir_path + ": " + reason);
        return;
    }

    auto buffer = std::make_unique<char[]>(BUFFER_SIZE);

    while (true) {
        long nread = syscall(SYS_getdents64, dir.fd, buffer.get(), BUFFER_SIZE);

        if (nread == -1) {
            const std::string reason = std::strerror(errno);
            if (is_root) {
                throw ScanError("Failed to list directory " + dir_path + ": " + reason);
            }
            Logger::error("DirectoryScanner: getdents64 failed for " + dir_path + ": " + reason);
            break;
        }
        if (nread == 0) break;

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.get() + pos);
            pos += d->d_reclen;

            // Hidden entries, including . and ..
            if (d->d_name[0] == '.') continue;

            uint8_t type = d->d_type;
            if (type == TYPE_UNKNOWN || type == TYPE_LNK) {
                // No d_type from the filesystem, or a symlink. A link is only
                // taken when it resolves to a regular file; linked directories
                // are not followed.
                struct stat entry_stat;
                if (fstatat(dir.fd, d->d_name, &entry_stat, AT_SYMLINK_NOFOLLOW) != 0) continue;
                if (S_ISLNK(entry_stat.st_mode)) {
                    if (fstatat(dir.fd, d->d_name, &entry_stat, 0) != 0) continue;
                    if (!S_ISREG(entry_stat.st_mode)) continue;
                    type = TYPE_REG;
                } else if (S_ISREG(entry_stat.st_mode)) {
                    type = TYPE_REG;
                } else if (S_ISDIR(entry_stat.st_mode)) {
                    type = TYPE_DIR;
                } else {
                    continue;
                }
            }

            std::string full_path = dir_path + "/" + d->d_name;

            if (type == TYPE_REG) {
                if (is_audio_extension(d->d_name)) {
                    files.emplace_back(std::move(full_path));
                }
            } else if (type == TYPE_DIR && recursive) {
                if (std::strcmp(d->d_name, UNSORTED_DIR) == 0) continue;
                scan_recursive(full_path, recursive, false, files);
            }
        }
    }
}

}  // namespace tagmv::util
