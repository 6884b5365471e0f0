#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

fs::path get_global_config_dir() {
    return platform::home_dir() / GLOBAL_CONFIG_DIR;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / GLOBAL_CONFIG_FILE;
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_FILE;
}

// yaml-cpp reads "True"/"yes"/"on" as booleans already; the extra pass
// through parse_bool accepts "1"/"0" as well.
static bool read_bool(const YAML::Node& node, const char* key) {
    std::string raw = node.as<std::string>();
    auto value = parse_bool(raw);
    if (!value) {
        throw std::runtime_error(fmt::format("'{}' must be a boolean, got '{}'", key, raw));
    }
    return *value;
}

static void parse_options(const YAML::Node& root, ServerOptions& o) {
    if (root["port"]) {
        o.port = root["port"].as<int>();
        if (o.port <= 0 || o.port > 65535) {
            throw std::runtime_error(fmt::format("'port' out of range: {}", o.port));
        }
    }
    if (root["static_root"]) {
        o.static_root = root["static_root"].as<std::string>();
    }
    if (root["strip_sources"]) {
        o.strip_sources = read_bool(root["strip_sources"], "strip_sources");
    }
    if (root["autoreload"]) {
        o.autoreload = read_bool(root["autoreload"], "autoreload");
    }
    if (root["template"]) {
        // `template: ~` disables templates, like an empty string
        o.template_name = root["template"].IsNull() ? "" : root["template"].as<std::string>();
    }
    if (root["connection_dir_root"]) {
        o.connection_dir_root = root["connection_dir_root"].as<std::string>();
    }
    if (root["base_url"]) {
        o.base_url = root["base_url"].as<std::string>();
    }
    if (root["log_level"]) {
        std::string raw = root["log_level"].as<std::string>();
        auto level = parse_log_level(raw);
        if (!level) {
            throw std::runtime_error(fmt::format("unknown 'log_level': {}", raw));
        }
        o.log_level = *level;
    }
    if (root["extra_template_dirs"]) {
        const auto& node = root["extra_template_dirs"];
        o.extra_template_dirs.clear();
        if (node.IsSequence()) {
            for (const auto& entry : node) {
                o.extra_template_dirs.emplace_back(entry.as<std::string>());
            }
        } else if (node.IsScalar()) {
            o.extra_template_dirs.emplace_back(node.as<std::string>());
        }
    }
}

Result<void> Config::apply_yaml(const std::string& text, const std::string& origin) {
    try {
        YAML::Node root = YAML::Load(text);
        if (root.IsNull()) {
            return Result<void>::Ok();
        }
        if (!root.IsMap()) {
            return Result<void>::Err(fmt::format("Failed to parse {}: top level must be a mapping", origin));
        }
        parse_options(root, options_);
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(fmt::format("Failed to parse {}: {}", origin, e.what()));
    }
}

Result<void> Config::apply_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<void>::Err(fmt::format("Failed to read config {}", path.string()));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return apply_yaml(buffer.str(), "config " + path.string());
}

Result<Config> Config::load(const fs::path& project_dir) {
    Config config;
    config.project_dir_ = project_dir;

    std::error_code ec;
    fs::path global = get_global_config_path();
    if (fs::exists(global, ec)) {
        auto r = config.apply_file(global);
        if (r.is_err()) return Result<Config>::Err(r.error);
        log_debug(fmt::format("loaded global config {}", global.string()));
    }

    fs::path project = get_project_config_path(project_dir);
    if (fs::exists(project, ec)) {
        auto r = config.apply_file(project);
        if (r.is_err()) return Result<Config>::Err(r.error);
        log_debug(fmt::format("loaded project config {}", project.string()));
    }

    return Result<Config>::Ok(config);
}
