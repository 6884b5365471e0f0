#include "template_registry.hpp"
#include "template_resolver.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

TemplateRegistry::TemplateRegistry(std::string template_name,
                                   std::vector<fs::path> candidate_roots,
                                   fs::path builtin_static)
    : template_name_(std::move(template_name)),
      candidate_roots_(std::move(candidate_roots)),
      builtin_static_(std::move(builtin_static)) {}

Result<void> TemplateRegistry::load() {
    return reload();
}

Result<void> TemplateRegistry::reload() {
    // Resolve outside the lock; only the swap is guarded
    auto resolved = resolve_template(template_name_, candidate_roots_, builtin_static_);
    if (resolved.is_err()) {
        return Result<void>::Err(resolved.error);
    }

    auto fresh = std::make_shared<const TemplatePaths>(std::move(resolved.value));
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(fresh);
    ++generation_;
    log_debug(fmt::format("template paths for '{}' loaded (generation {})", template_name_, generation_));
    return Result<void>::Ok();
}

std::shared_ptr<const TemplatePaths> TemplateRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

int TemplateRegistry::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}
