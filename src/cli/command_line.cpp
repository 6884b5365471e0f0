#include "command_line.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

static const std::map<std::string, std::string>& aliases() {
    static const std::map<std::string, std::string> table = {
        {"port",                "port"},
        {"static",              "static_root"},
        {"static_root",         "static_root"},
        {"strip_sources",       "strip_sources"},
        {"autoreload",          "autoreload"},
        {"template",            "template"},
        {"connection_dir_root", "connection_dir_root"},
        {"base_url",            "base_url"},
        {"log-level",           "log_level"},
        {"log_level",           "log_level"},
        {"template-dir",        "extra_template_dirs"},
    };
    return table;
}

static bool is_bool_option(const std::string& option) {
    return option == "strip_sources" || option == "autoreload";
}

std::optional<std::string> option_for_alias(const std::string& alias) {
    auto it = aliases().find(alias);
    if (it == aliases().end()) return std::nullopt;
    return it->second;
}

Result<CommandLine> parse_command_line(const std::vector<std::string>& args) {
    CommandLine cmd;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") { cmd.show_help = true; continue; }
        if (arg == "--version") { cmd.show_version = true; continue; }
        if (arg == "--debug") { cmd.overrides["log_level"] = "DEBUG"; continue; }

        if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
            positional.push_back(arg);
            continue;
        }

        std::string body = arg.substr(2);
        std::string key = body;
        std::optional<std::string> value;
        auto eq = body.find('=');
        if (eq != std::string::npos) {
            key = body.substr(0, eq);
            value = body.substr(eq + 1);
        }

        auto option = option_for_alias(key);
        if (!option) {
            return Result<CommandLine>::Err(fmt::format("Unknown option: --{}", key));
        }

        if (!value) {
            bool has_next = i + 1 < args.size();
            if (is_bool_option(*option)) {
                // Bare flag means true; a following word is taken only if it is a boolean
                if (has_next && parse_bool(args[i + 1])) {
                    value = args[++i];
                } else {
                    value = "true";
                }
            } else if (has_next) {
                value = args[++i];
            } else {
                return Result<CommandLine>::Err(fmt::format("Option --{} needs a value", key));
            }
        }

        if (*option == "extra_template_dirs") {
            // Repeatable; collected in order
            auto& acc = cmd.overrides[*option];
            if (!acc.empty()) acc += '\n';
            acc += *value;
        } else {
            cmd.overrides[*option] = *value;
        }
    }

    if (positional.size() > 1) {
        return Result<CommandLine>::Err(
            fmt::format("Expected at most one notebook, got {}: {}", positional.size(), join_list(positional)));
    }
    if (positional.size() == 1) {
        cmd.notebook_path = positional[0];
    }
    return Result<CommandLine>::Ok(cmd);
}

Result<void> apply_command_line(const CommandLine& cmd, ServerOptions& options) {
    for (const auto& [option, value] : cmd.overrides) {
        if (option == "port") {
            auto port = parse_int(value);
            if (!port || *port <= 0 || *port > 65535) {
                return Result<void>::Err(fmt::format("Invalid port: {}", value));
            }
            options.port = *port;
        } else if (option == "static_root") {
            options.static_root = value;
        } else if (option == "strip_sources" || option == "autoreload") {
            auto flag = parse_bool(value);
            if (!flag) {
                return Result<void>::Err(fmt::format("Invalid value for --{}: {}", option, value));
            }
            (option == "strip_sources" ? options.strip_sources : options.autoreload) = *flag;
        } else if (option == "template") {
            options.template_name = value;
        } else if (option == "connection_dir_root") {
            options.connection_dir_root = value;
        } else if (option == "base_url") {
            options.base_url = value;
        } else if (option == "log_level") {
            auto level = parse_log_level(value);
            if (!level) {
                return Result<void>::Err(fmt::format("Invalid log level: {}", value));
            }
            options.log_level = *level;
        } else if (option == "extra_template_dirs") {
            // Replaces the config list, like any other option
            options.extra_template_dirs.clear();
            for (const auto& dir : split(value, '\n')) {
                options.extra_template_dirs.emplace_back(dir);
            }
        }
    }

    if (cmd.notebook_path) {
        options.notebook_path = cmd.notebook_path;
    }
    return Result<void>::Ok();
}

std::string usage_text() {
    return fmt::format(
        "folio [OPTIONS] NOTEBOOK_FILENAME\n"
        "\n"
        "    Launches a stand-alone server for read-only notebooks.\n"
        "    Without a notebook, serves a tree of the current directory.\n"
        "\n"
        "Options:\n"
        "    --port=<int>                 Port of the server (default {})\n"
        "    --static=<dir>               Directory holding built-in static assets\n"
        "    --strip_sources=<bool>       Strip sources from rendered html (default true)\n"
        "    --autoreload=<bool>          Reload templates when they change (default false)\n"
        "    --template=<name>            Template to use (default '{}', empty for none)\n"
        "    --template-dir=<dir>         Extra template root, searched first (repeatable)\n"
        "    --connection_dir_root=<dir>  Where connection files are stored (default: temp dir)\n"
        "    --base_url=<url>             Base URL of the application (default '{}')\n"
        "    --log-level=<level>          DEBUG, INFO, WARNING or ERROR\n"
        "    --debug                      Same as --log-level=DEBUG\n"
        "    --version                    Show version\n"
        "    --help                       Show this help\n",
        DEFAULT_PORT, DEFAULT_TEMPLATE_NAME, DEFAULT_BASE_URL);
}
