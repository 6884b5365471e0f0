#include "folio_cli.hpp"
#include "command_line.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <server/connection_dir.hpp>
#include <templates/search_roots.hpp>
#include <templates/template_registry.hpp>
#include <fmt/format.h>
#include <ostream>

FolioCLI::FolioCLI(std::ostream& out) : out_(out) {}

Result<ServerOptions> FolioCLI::load_options(const std::vector<std::string>& args, bool& done) {
    done = false;

    auto cmd = parse_command_line(args);
    if (cmd.is_err()) {
        return Result<ServerOptions>::Err(cmd.error);
    }
    if (cmd.value.show_help) {
        out_ << usage_text();
        done = true;
        return Result<ServerOptions>::Ok(ServerOptions{});
    }
    if (cmd.value.show_version) {
        out_ << theme::bold("folio") << theme::dim(fmt::format(" version {}", FOLIO_VERSION)) << "\n";
        done = true;
        return Result<ServerOptions>::Ok(ServerOptions{});
    }

    auto config = Config::load();
    if (config.is_err()) {
        return Result<ServerOptions>::Err(config.error);
    }

    ServerOptions options = config.value.options();
    auto applied = apply_command_line(cmd.value, options);
    if (applied.is_err()) {
        return Result<ServerOptions>::Err(applied.error);
    }
    return Result<ServerOptions>::Ok(options);
}

int FolioCLI::run(const std::vector<std::string>& args) {
    bool done = false;
    auto loaded = load_options(args, done);
    if (loaded.is_err()) {
        out_ << theme::fail(loaded.error);
        out_ << theme::step("Run 'folio --help' for usage.");
        return 1;
    }
    if (done) return 0;

    const ServerOptions& options = loaded.value;
    set_log_level(options.log_level);

    fs::path static_root = options.static_root.empty() ? builtin_static_dir() : options.static_root;
    std::vector<fs::path> roots = template_search_roots(options.extra_template_dirs);
    for (const auto& root : roots) {
        log_debug(fmt::format("template root: {}", root.string()));
    }

    TemplateRegistry registry(options.template_name, roots, static_root);
    auto loaded_paths = registry.load();
    if (loaded_paths.is_err()) {
        out_ << theme::fail(loaded_paths.error);
        return 1;
    }
    auto paths = registry.snapshot();
    out_ << theme::ok(fmt::format("Resolved template '{}' ({} layers)",
                                  registry.template_name(), paths->chain.size()));

    auto conn = ConnectionDir::create(options.connection_dir_root);
    if (conn.is_err()) {
        out_ << theme::fail(conn.error);
        return 1;
    }
    ConnectionDir connection_dir = std::move(conn.value);
    log_info(fmt::format("Serving static files from {}.", static_root.string()));

    print_resolution(registry.template_name(), *paths);

    out_ << theme::section("Server");
    out_ << theme::kv("port", std::to_string(options.port));
    out_ << theme::kv("base url", options.base_url);
    out_ << theme::kv("mode", options.notebook_path ? "notebook " + *options.notebook_path : "tree");
    out_ << theme::kv("strip sources", options.strip_sources ? "yes" : "no");
    out_ << theme::kv("autoreload", options.autoreload ? "yes" : "no");
    out_ << theme::kv("connections", connection_dir.path().string());

    out_ << theme::kv("kernel msgs", join_list(allowed_kernel_message_types()));

    print_routes(build_routes(options, *paths));
    return 0;
}

void FolioCLI::print_resolution(const std::string& template_name, const TemplatePaths& paths) {
    out_ << theme::section(template_name.empty() ? "Template (none)" : "Template " + template_name);

    if (!paths.chain.empty()) {
        std::string chain;
        for (const auto& layer : paths.chain) {
            if (!chain.empty()) chain += " -> ";
            chain += layer.name;
        }
        out_ << theme::kv("chain", chain);
    }

    auto list = [this](const char* title, const std::vector<fs::path>& dirs) {
        out_ << theme::step(title);
        int i = 1;
        for (const auto& d : dirs) out_ << theme::item(i++, d.string());
    };
    list("page templates", paths.template_paths);
    list("static assets", paths.static_paths);
    list("conversion templates", paths.conversion_template_paths);

    if (!paths.diagnostics.empty()) {
        out_ << "\n";
        for (const auto& d : paths.diagnostics) {
            out_ << theme::warn(fmt::format("{}: {}", diagnostic_kind_name(d.kind), d.message));
        }
    }
}

void FolioCLI::print_routes(const std::vector<Route>& routes) {
    out_ << theme::section("Routes");
    for (const auto& route : routes) {
        out_ << theme::kv(handler_kind_name(route.handler), route.pattern);
    }
    out_ << "\n";
}
