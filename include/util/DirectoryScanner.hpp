#pragma once

#include <array>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tagmv::util {

// Thrown when the scan root itself cannot be read.
class ScanError : public std::runtime_error {
public:
    explicit ScanError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * DirectoryScanner: enumerates the audio files to organize, using the
 * getdents64 syscall directly.
 *
 * Skips hidden entries (leading '.'), and in recursive mode never enters
 * an "_Unsorted" directory. The result is sorted so that scan order, which
 * decides naming conflicts, is the same on every run.
 */
class DirectoryScanner {
public:
    /**
     * @param root_dir  Directory to scan
     * @param recursive Descend into subdirectories
     * @return Absolute paths of matching audio files, sorted
     * @throws ScanError when root_dir cannot be opened
     */
    [[nodiscard]] static std::vector<std::filesystem::path> scan(const std::filesystem::path& root_dir, bool recursive);

    /**
     * Case-insensitive match against mp3, m4a, flac, ogg, wma, aac, wav.
     */
    [[nodiscard]] static bool is_audio_extension(const char* filename);

private:
    static constexpr size_t BUFFER_SIZE = 256 * 1024;  // 256KB buffer for getdents64

    static constexpr std::array<std::string_view, 7> AUDIO_EXTENSIONS = {
        ".aac", ".flac", ".m4a", ".mp3", ".ogg", ".wav", ".wma"
    };

    static void scan_recursive(const std::string& dir_path, bool recursive, bool is_root,
                               std::vector<std::filesystem::path>& files);
};

}  // namespace tagmv::util
