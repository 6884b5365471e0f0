#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "template_types.hpp"

// Holds the search paths currently in use. Readers take a snapshot and keep
// it for the whole request; reload() builds a new resolution off to the side
// and swaps it in only if it succeeded.
class TemplateRegistry {
public:
    TemplateRegistry(std::string template_name,
                     std::vector<fs::path> candidate_roots,
                     fs::path builtin_static);

    // Initial resolution. Same as reload().
    Result<void> load();

    // On failure the previous paths stay in place.
    Result<void> reload();

    // nullptr until the first successful load().
    std::shared_ptr<const TemplatePaths> snapshot() const;

    const std::string& template_name() const { return template_name_; }
    int generation() const;

private:
    std::string template_name_;
    std::vector<fs::path> candidate_roots_;
    fs::path builtin_static_;

    mutable std::mutex mutex_;
    std::shared_ptr<const TemplatePaths> current_;
    int generation_ = 0;
};
