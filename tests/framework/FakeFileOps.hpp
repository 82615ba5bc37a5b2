#pragma once

#include "util/FileOps.hpp"
#include <set>
#include <string>

namespace tagmv::test {

// Disk stand-in for the resolver: only answers exists() from a fixed set.
class FakeDiskOps : public util::FileOps {
public:
    std::set<std::string> existing;  // absolute generic paths
    std::set<std::string> unreadable;
    int mutations = 0;
    int lookups = 0;

    bool exists(const std::filesystem::path& path, std::error_code& ec) override {
        ++lookups;
        if (unreadable.count(path.generic_string())) {
            ec = std::make_error_code(std::errc::permission_denied);
            return false;
        }
        return existing.count(path.generic_string()) > 0;
    }
    void create_directories(const std::filesystem::path&, std::error_code& ec) override { mutate(ec); }
    void rename(const std::filesystem::path&, const std::filesystem::path&, std::error_code& ec) override { mutate(ec); }
    void copy_file(const std::filesystem::path&, const std::filesystem::path&, std::error_code& ec) override { mutate(ec); }
    std::uintmax_t file_size(const std::filesystem::path&, std::error_code& ec) override {
        ec = std::make_error_code(std::errc::operation_not_supported);
        return 0;
    }
    void remove(const std::filesystem::path&, std::error_code& ec) override { mutate(ec); }

private:
    void mutate(std::error_code& ec) {
        ++mutations;
        ec = std::make_error_code(std::errc::operation_not_supported);
    }
};

// Real filesystem, but every rename looks like it crosses a device and
// removing `undeletable` fails.
class CrossDeviceOps : public util::LocalFileOps {
public:
    std::filesystem::path undeletable;
    bool truncate_copy = false;

    void rename(const std::filesystem::path&, const std::filesystem::path&, std::error_code& ec) override {
        ec = std::make_error_code(std::errc::cross_device_link);
    }

    void copy_file(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) override {
        LocalFileOps::copy_file(from, to, ec);
        if (!ec && truncate_copy) {
            std::filesystem::resize_file(to, 1, ec);
        }
    }

    void remove(const std::filesystem::path& path, std::error_code& ec) override {
        if (!undeletable.empty() && path == undeletable) {
            ec = std::make_error_code(std::errc::permission_denied);
            return;
        }
        LocalFileOps::remove(path, ec);
    }
};

} // namespace tagmv::test
