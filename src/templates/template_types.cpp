#include "template_types.hpp"
#include <algorithm>

const char* diagnostic_kind_name(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::MissingSubdirectory: return "missing-subdirectory";
        case DiagnosticKind::TemplateNotFound:    return "template-not-found";
        case DiagnosticKind::ManifestUnreadable:  return "manifest-unreadable";
        case DiagnosticKind::ManifestMalformed:   return "manifest-malformed";
    }
    return "unknown";
}

size_t TemplatePaths::count(DiagnosticKind kind) const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
        [kind](const Diagnostic& d) { return d.kind == kind; }));
}
