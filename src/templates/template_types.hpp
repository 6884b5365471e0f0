#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Contents of a package's conf.json. Only base_template is recognized.
struct TemplateManifest {
    std::optional<std::string> base_template;
};

// Soft errors produced while resolving. None of them stop the resolution.
enum class DiagnosticKind {
    MissingSubdirectory,    // package lacks templates/, static/ or nbconvert_templates/
    TemplateNotFound,       // no candidate root contains the requested layer
    ManifestUnreadable,     // conf.json exists but could not be opened
    ManifestMalformed,      // conf.json is not valid JSON, or not an object
};

struct Diagnostic {
    DiagnosticKind kind;
    std::string template_name;
    fs::path path;
    std::string message;
};

const char* diagnostic_kind_name(DiagnosticKind kind);

// One resolved level of the inheritance chain.
struct TemplateLayer {
    std::string name;
    fs::path package_dir;
    bool has_manifest = false;
};

// Ordered layers, most derived first.
struct TemplateChain {
    std::vector<TemplateLayer> layers;
    std::vector<Diagnostic> diagnostics;
};

// Output of a resolution. Each list is highest priority first.
struct TemplatePaths {
    std::vector<fs::path> template_paths;
    std::vector<fs::path> static_paths;
    std::vector<fs::path> conversion_template_paths;

    std::vector<TemplateLayer> chain;
    std::vector<Diagnostic> diagnostics;

    size_t count(DiagnosticKind kind) const;
};
