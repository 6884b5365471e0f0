#include "template_resolver.hpp"
#include "template_chain.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <fmt/format.h>

// Put `path` at the front. If a less specific layer already registered it,
// the entry moves up to the more specific position.
static void push_front_unique(std::vector<fs::path>& paths, const fs::path& path) {
    fs::path normal = path.lexically_normal();
    paths.erase(std::remove_if(paths.begin(), paths.end(),
                    [&](const fs::path& p) { return p.lexically_normal() == normal; }),
                paths.end());
    paths.insert(paths.begin(), path);
}

TemplatePaths materialize_search_paths(const TemplateChain& chain,
                                       const TemplateSource& source,
                                       const fs::path& builtin_static) {
    TemplatePaths result;
    result.chain = chain.layers;
    result.diagnostics = chain.diagnostics;

    struct Slot {
        const char* subdir;
        std::vector<fs::path>* paths;
    };
    const Slot slots[] = {
        {TEMPLATE_CONVERSION_SUBDIR, &result.conversion_template_paths},
        {TEMPLATE_STATIC_SUBDIR,     &result.static_paths},
        {TEMPLATE_PAGES_SUBDIR,      &result.template_paths},
    };

    // Base first, so every derived layer lands in front of it
    for (auto it = chain.layers.rbegin(); it != chain.layers.rend(); ++it) {
        const TemplateLayer& layer = *it;
        for (const auto& slot : slots) {
            fs::path dir = layer.package_dir / slot.subdir;
            if (!source.directory_exists(dir)) {
                result.diagnostics.push_back({
                    DiagnosticKind::MissingSubdirectory, layer.name, dir,
                    fmt::format("template named {} found at path {}, but {} does not exist",
                                layer.name, layer.package_dir.string(), dir.string())});
            }
            push_front_unique(*slot.paths, dir);
        }
    }

    // The fallback stays last even if a template registered the same directory
    auto& statics = result.static_paths;
    fs::path fallback = builtin_static.lexically_normal();
    statics.erase(std::remove_if(statics.begin(), statics.end(),
                      [&](const fs::path& p) { return p.lexically_normal() == fallback; }),
                  statics.end());
    statics.push_back(builtin_static);

    return result;
}

static std::vector<std::string> to_strings(const std::vector<fs::path>& paths) {
    std::vector<std::string> out;
    out.reserve(paths.size());
    for (const auto& p : paths) out.push_back(p.string());
    return out;
}

Result<TemplatePaths> resolve_template(const std::string& name,
                                       const TemplateSource& source,
                                       const fs::path& builtin_static) {
    if (name.empty()) {
        TemplatePaths result;
        result.static_paths.push_back(builtin_static);
        log_debug("no template requested, serving built-in static files only");
        return Result<TemplatePaths>::Ok(result);
    }

    auto chain = plan_template_chain(name, source);
    if (chain.is_err()) {
        log_error(chain.error);
        return Result<TemplatePaths>::Err(chain.error);
    }

    TemplatePaths result = materialize_search_paths(chain.value, source, builtin_static);

    for (const auto& d : result.diagnostics) {
        log_warning(d.message);
    }
    log_debug(fmt::format("using template: {}", name));
    log_debug(fmt::format("nbconvert template paths: {}", join_list(to_strings(result.conversion_template_paths))));
    log_debug(fmt::format("template paths: {}", join_list(to_strings(result.template_paths))));
    log_debug(fmt::format("static paths: {}", join_list(to_strings(result.static_paths))));

    return Result<TemplatePaths>::Ok(result);
}

Result<TemplatePaths> resolve_template(const std::string& name,
                                       const std::vector<fs::path>& candidate_roots,
                                       const fs::path& builtin_static) {
    DiskTemplateSource source(candidate_roots);
    return resolve_template(name, source, builtin_static);
}
