#include "template_source.hpp"

DiskTemplateSource::DiskTemplateSource(std::vector<fs::path> candidate_roots)
    : roots_(std::move(candidate_roots)) {}

std::optional<fs::path> DiskTemplateSource::locate(const std::string& name) const {
    if (name.empty()) return std::nullopt;

    for (const auto& root : roots_) {
        fs::path dir = root / name;
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            // First match wins; lower-priority roots are not consulted
            return dir;
        }
    }
    return std::nullopt;
}

ManifestLoad DiskTemplateSource::load_manifest(const fs::path& package_dir) const {
    return load_template_manifest(package_dir);
}

bool DiskTemplateSource::directory_exists(const fs::path& dir) const {
    std::error_code ec;
    return fs::is_directory(dir, ec);
}
