#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Reads an environment variable. Unset and empty both give nullopt.
std::optional<std::string> env(const char* name);

// Creates a fresh, uniquely named directory <parent>/<prefix>XXXXXX.
Result<std::filesystem::path> make_temp_dir(const std::filesystem::path& parent,
                                            const std::string& prefix);

// Separator used in PATH-like environment variables.
char path_list_separator();

} // namespace platform
