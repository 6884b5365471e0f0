#include "static_lookup.hpp"

// Normalized form of a relative request, or nullopt if it is absolute or
// climbs out.
static std::optional<fs::path> sanitize(const std::string& request_path) {
    fs::path rel(request_path);
    if (rel.has_root_name() || rel.has_root_directory()) return std::nullopt;
    for (const auto& part : rel) {
        if (part == "..") return std::nullopt;
    }
    return rel.lexically_normal();
}

std::optional<fs::path> find_static_file(const std::vector<fs::path>& search_paths,
                                         const std::string& request_path,
                                         const std::string& default_filename) {
    auto rel = sanitize(request_path);
    if (!rel) return std::nullopt;

    bool wants_dir = request_path.empty() || request_path.back() == '/';

    for (const auto& dir : search_paths) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;

        fs::path candidate = dir / *rel;
        if (wants_dir || fs::is_directory(candidate, ec)) {
            if (default_filename.empty()) continue;
            candidate /= default_filename;
        }
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.lexically_normal();
        }
    }
    return std::nullopt;
}
