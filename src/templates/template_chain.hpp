#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>
#include "template_types.hpp"
#include "template_source.hpp"

// The layer `name` inherits from, given its manifest (nullptr = no manifest).
// Every template bases on "default" unless it is "default" itself; an
// explicit base_template overrides this, even for "default".
std::optional<std::string> base_template_for(const std::string& name,
                                             const TemplateManifest* manifest);

// Walk the inheritance chain starting at `name`. Stops at "default" without
// an explicit base, or at a name no candidate root contains. Fails only if a
// name repeats (inheritance cycle).
Result<TemplateChain> plan_template_chain(const std::string& name,
                                          const TemplateSource& source);
