#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
};

// Server settings after merging global config, project config and the command line
struct ServerOptions {
    int port = 8866;
    std::filesystem::path static_root;              // empty = built-in static dir
    bool strip_sources = true;
    bool autoreload = false;
    std::string template_name = "default";          // empty = no template mechanism
    std::filesystem::path connection_dir_root;      // empty = system temp dir
    std::string base_url = "/";
    LogLevel log_level = LogLevel::Info;
    std::vector<std::filesystem::path> extra_template_dirs;  // searched before the standard roots
    std::optional<std::string> notebook_path;       // unset = tree mode
};
