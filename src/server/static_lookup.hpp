#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

// Find the file a static request maps to. Directories are searched in order and
// the first regular file wins. Requests for a directory (or ending in '/')
// get default_filename appended. Requests that would leave the search
// directory are refused.
std::optional<fs::path> find_static_file(const std::vector<fs::path>& search_paths,
                                         const std::string& request_path,
                                         const std::string& default_filename);
