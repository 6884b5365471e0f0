#pragma once

#include <string>
#include <vector>
#include <optional>
#include "template_types.hpp"
#include "template_manifest.hpp"

// Filesystem access used by the resolver. The resolver only asks three
// questions, so tests can answer them from memory.
class TemplateSource {
public:
    virtual ~TemplateSource() = default;

    // Package directory for `name` in the first candidate root that has one.
    virtual std::optional<fs::path> locate(const std::string& name) const = 0;

    virtual ManifestLoad load_manifest(const fs::path& package_dir) const = 0;

    virtual bool directory_exists(const fs::path& dir) const = 0;
};

// Looks for <root>/<name>/ in each candidate root, highest priority first.
class DiskTemplateSource : public TemplateSource {
public:
    explicit DiskTemplateSource(std::vector<fs::path> candidate_roots);

    std::optional<fs::path> locate(const std::string& name) const override;
    ManifestLoad load_manifest(const fs::path& package_dir) const override;
    bool directory_exists(const fs::path& dir) const override;

private:
    std::vector<fs::path> roots_;
};
