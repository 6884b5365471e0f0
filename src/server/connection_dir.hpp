#pragma once

#include <filesystem>
#include <string>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Private directory for kernel connection files. Created under a root with
// a "folio_" prefix and removed recursively when the owner goes away.
class ConnectionDir {
public:
    static Result<ConnectionDir> create(const fs::path& root);

    ConnectionDir() = default;
    ~ConnectionDir();

    ConnectionDir(const ConnectionDir&) = delete;
    ConnectionDir& operator=(const ConnectionDir&) = delete;
    ConnectionDir(ConnectionDir&& other) noexcept;
    ConnectionDir& operator=(ConnectionDir&& other) noexcept;

    const fs::path& path() const { return path_; }
    bool valid() const { return !path_.empty(); }

    // Remove now instead of at destruction. Failures are logged, never thrown.
    void remove() noexcept;

private:
    explicit ConnectionDir(fs::path path) : path_(std::move(path)) {}

    fs::path path_;
};
