#pragma once

#include <cstdint>
#include <filesystem>
#include <system_error>

namespace tagmv::util {

// Filesystem primitives used by the resolver and the executor. Every call
// reports failure through `ec` and never throws.
class FileOps {
public:
    virtual ~FileOps() = default;

    virtual bool exists(const std::filesystem::path& path, std::error_code& ec) = 0;
    virtual void create_directories(const std::filesystem::path& dir, std::error_code& ec) = 0;
    virtual void rename(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) = 0;

    // Fails (without overwriting) when `to` already exists.
    virtual void copy_file(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) = 0;

    virtual std::uintmax_t file_size(const std::filesystem::path& path, std::error_code& ec) = 0;
    virtual void remove(const std::filesystem::path& path, std::error_code& ec) = 0;
};

class LocalFileOps : public FileOps {
public:
    bool exists(const std::filesystem::path& path, std::error_code& ec) override;
    void create_directories(const std::filesystem::path& dir, std::error_code& ec) override;
    void rename(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) override;
    void copy_file(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) override;
    std::uintmax_t file_size(const std::filesystem::path& path, std::error_code& ec) override;
    void remove(const std::filesystem::path& path, std::error_code& ec) override;
};

}  // namespace tagmv::util
