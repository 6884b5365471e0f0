#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <core/types.hpp>

// folio [OPTIONS] [NOTEBOOK_FILENAME]
struct CommandLine {
    bool show_help = false;
    bool show_version = false;
    std::map<std::string, std::string> overrides;   // option name -> raw value
    std::optional<std::string> notebook_path;
};

// Canonical option name for a command-line alias ("static" -> "static_root"),
// or nullopt if the alias is unknown.
std::optional<std::string> option_for_alias(const std::string& alias);

// Accepts --key=value and --key value. Boolean options may be given bare.
Result<CommandLine> parse_command_line(const std::vector<std::string>& args);

// Apply the parsed values on top of options loaded from config files.
Result<void> apply_command_line(const CommandLine& cmd, ServerOptions& options);

std::string usage_text();
