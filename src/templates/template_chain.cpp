#include "template_chain.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <set>

std::optional<std::string> base_template_for(const std::string& name,
                                             const TemplateManifest* manifest) {
    if (manifest && manifest->base_template) {
        return manifest->base_template;
    }
    if (name != DEFAULT_TEMPLATE_NAME) {
        return std::string(DEFAULT_TEMPLATE_NAME);
    }
    return std::nullopt;
}

static std::string describe_cycle(const std::vector<TemplateLayer>& layers,
                                  const std::string& repeated) {
    std::string out;
    bool in_cycle = false;
    for (const auto& layer : layers) {
        if (layer.name == repeated) in_cycle = true;
        if (in_cycle) out += layer.name + " -> ";
    }
    return out + repeated;
}

Result<TemplateChain> plan_template_chain(const std::string& name,
                                          const TemplateSource& source) {
    TemplateChain chain;
    std::set<std::string> visited;
    std::optional<std::string> next = name;

    while (next) {
        std::string current = *next;
        next.reset();

        if (!visited.insert(current).second) {
            return Result<TemplateChain>::Err(
                fmt::format("template inheritance cycle: {}", describe_cycle(chain.layers, current)));
        }

        auto dir = source.locate(current);
        if (!dir) {
            chain.diagnostics.push_back({
                DiagnosticKind::TemplateNotFound, current, {},
                fmt::format("template named {} not found in any template directory", current)});
            break;
        }

        TemplateLayer layer;
        layer.name = current;
        layer.package_dir = *dir;

        ManifestLoad load = source.load_manifest(*dir);
        const TemplateManifest* manifest = nullptr;
        switch (load.status) {
            case ManifestLoad::Status::Absent:
                break;
            case ManifestLoad::Status::Loaded:
                layer.has_manifest = true;
                manifest = &load.manifest;
                break;
            case ManifestLoad::Status::Unreadable:
                chain.diagnostics.push_back({
                    DiagnosticKind::ManifestUnreadable, current, *dir / TEMPLATE_MANIFEST_FILE,
                    fmt::format("template named {}: {}, ignoring it", current, load.error)});
                break;
            case ManifestLoad::Status::Malformed:
                chain.diagnostics.push_back({
                    DiagnosticKind::ManifestMalformed, current, *dir / TEMPLATE_MANIFEST_FILE,
                    fmt::format("template named {}: {} in {}, ignoring it", current, load.error,
                                (*dir / TEMPLATE_MANIFEST_FILE).string())});
                break;
        }

        next = base_template_for(current, manifest);
        chain.layers.push_back(std::move(layer));
    }

    return Result<TemplateChain>::Ok(chain);
}
