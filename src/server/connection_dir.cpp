#include "connection_dir.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <cstdio>
#include <exception>

Result<ConnectionDir> ConnectionDir::create(const fs::path& root) {
    fs::path parent = root.empty() ? platform::temp_dir() : root;
    auto made = platform::make_temp_dir(parent, CONNECTION_DIR_PREFIX);
    if (made.is_err()) {
        return Result<ConnectionDir>::Err(made.error);
    }
    log_info(fmt::format("Storing connection files in {}.", made.value.string()));
    return Result<ConnectionDir>::Ok(ConnectionDir(made.value));
}

ConnectionDir::~ConnectionDir() {
    remove();
}

ConnectionDir::ConnectionDir(ConnectionDir&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ConnectionDir& ConnectionDir::operator=(ConnectionDir&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ConnectionDir::remove() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        // Runs from the destructor, so a failing log write must not escape
        try {
            log_warning(fmt::format("Could not remove connection directory {}: {}",
                                    path_.string(), ec.message()));
        } catch (const std::exception& e) {
            std::fprintf(stderr, "folio: connection directory not removed: %s\n", e.what());
        }
    }
    path_.clear();
}
