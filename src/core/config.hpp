#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    Config() = default;

    // Defaults, then ~/.folio/config.yaml, then ./folio.yaml. Missing files
    // are skipped; a file that fails to parse is an error.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Overlay one YAML document on top of the current options. Only keys
    // present in the document change.
    Result<void> apply_yaml(const std::string& text, const std::string& origin);
    Result<void> apply_file(const fs::path& path);

    const ServerOptions& options() const { return options_; }
    ServerOptions& options() { return options_; }

    const fs::path& project_dir() const { return project_dir_; }

private:
    ServerOptions options_;
    fs::path project_dir_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());
