#pragma once

#include <string>
#include <core/types.hpp>
#include "template_types.hpp"

// Parse conf.json text. JSON is read through yaml-cpp (JSON is a flow-style
// subset of YAML 1.2), so block-style YAML and unquoted keys are rejected.
// Errors on parse failure, on a non-object root, and on a base_template that
// is not a string. A null base_template counts as absent; on a repeated key
// the last value wins.
Result<TemplateManifest> parse_template_manifest(const std::string& text);

struct ManifestLoad {
    enum class Status { Absent, Loaded, Unreadable, Malformed };

    Status status = Status::Absent;
    TemplateManifest manifest;
    std::string error;   // set for Unreadable / Malformed

    bool found() const { return status != Status::Absent; }
};

// Read <package_dir>/conf.json from disk.
ManifestLoad load_template_manifest(const fs::path& package_dir);
