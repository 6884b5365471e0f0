#include "template_manifest.hpp"
#include <core/constants.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <optional>
#include <sstream>

// yaml-cpp tags quoted scalars "!" and plain ones "?". A JSON string is
// always quoted, so a plain scalar is a number, a boolean or bare YAML text.
static bool is_json_string(const YAML::Node& node) {
    return node.IsScalar() && node.Tag() == "!";
}

Result<TemplateManifest> parse_template_manifest(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Result<TemplateManifest>::Err(fmt::format("invalid JSON: {}", e.what()));
    }

    if (!root.IsMap()) {
        return Result<TemplateManifest>::Err("manifest is not a JSON object");
    }
    if (root.Style() != YAML::EmitterStyle::Flow) {
        return Result<TemplateManifest>::Err("manifest is YAML, not a JSON object");
    }

    // Walk the pairs rather than indexing: JSON keys must be strings, and on a
    // repeated key the last value wins.
    std::optional<YAML::Node> base;
    for (const auto& entry : root) {
        if (!is_json_string(entry.first)) {
            return Result<TemplateManifest>::Err(
                fmt::format("object key {} is not a string", entry.first.Scalar()));
        }
        if (entry.first.Scalar() == MANIFEST_BASE_TEMPLATE_KEY) {
            base.emplace(entry.second);
        }
    }

    TemplateManifest manifest;
    if (!base || base->IsNull()) {
        return Result<TemplateManifest>::Ok(manifest);
    }
    if (!is_json_string(*base)) {
        return Result<TemplateManifest>::Err(
            fmt::format("'{}' must be a string", MANIFEST_BASE_TEMPLATE_KEY));
    }
    manifest.base_template = base->Scalar();
    return Result<TemplateManifest>::Ok(manifest);
}

ManifestLoad load_template_manifest(const fs::path& package_dir) {
    ManifestLoad load;
    fs::path conf_file = package_dir / TEMPLATE_MANIFEST_FILE;

    std::error_code ec;
    if (!fs::exists(conf_file, ec)) {
        return load;
    }

    std::ifstream in(conf_file);
    if (!in) {
        load.status = ManifestLoad::Status::Unreadable;
        load.error = fmt::format("cannot open {}", conf_file.string());
        return load;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parse_template_manifest(buffer.str());
    if (parsed.is_err()) {
        load.status = ManifestLoad::Status::Malformed;
        load.error = parsed.error;
        return load;
    }

    load.status = ManifestLoad::Status::Loaded;
    load.manifest = parsed.value;
    return load;
}
