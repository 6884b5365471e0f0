#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "template_types.hpp"
#include "template_source.hpp"

// Turn a resolved chain into the three search paths. Base layers are laid
// down first and each derived layer is put in front of them. Missing
// subdirectories are still registered, with a warning each. The built-in
// static directory always ends static_paths.
TemplatePaths materialize_search_paths(const TemplateChain& chain,
                                       const TemplateSource& source,
                                       const fs::path& builtin_static);

// Resolve `name` against `source`. An empty name means no template: the
// result holds only the built-in static directory. Diagnostics are logged as
// warnings and also returned in the result. Fails only on an inheritance cycle.
Result<TemplatePaths> resolve_template(const std::string& name,
                                       const TemplateSource& source,
                                       const fs::path& builtin_static);

// Same, searching the given candidate roots on disk.
Result<TemplatePaths> resolve_template(const std::string& name,
                                       const std::vector<fs::path>& candidate_roots,
                                       const fs::path& builtin_static);
