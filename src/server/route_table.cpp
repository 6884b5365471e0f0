#include "route_table.hpp"
#include <core/constants.hpp>

const char* handler_kind_name(HandlerKind kind) {
    switch (kind) {
        case HandlerKind::Kernel:         return "kernel";
        case HandlerKind::KernelChannels: return "kernel-channels";
        case HandlerKind::StaticFiles:    return "static";
        case HandlerKind::Render:         return "render";
        case HandlerKind::Tree:           return "tree";
    }
    return "unknown";
}

const std::vector<std::string>& allowed_kernel_message_types() {
    static const std::vector<std::string> types = {
        "comm_msg",
        "comm_info_request",
        "kernel_info_request",
        "shutdown_request",
    };
    return types;
}

static std::string strip_slashes(const std::string& s) {
    auto start = s.find_first_not_of('/');
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of('/');
    return s.substr(start, end - start + 1);
}

std::string url_path_join(const std::vector<std::string>& pieces) {
    if (pieces.empty()) return "";

    bool initial = !pieces.front().empty() && pieces.front().front() == '/';
    bool final = !pieces.back().empty() && pieces.back().back() == '/';

    std::string result;
    for (const auto& piece : pieces) {
        std::string s = strip_slashes(piece);
        if (s.empty()) continue;
        if (!result.empty()) result += '/';
        result += s;
    }
    if (initial) result = "/" + result;
    if (final) result += "/";
    if (result == "//") result = "/";
    return result;
}

std::vector<Route> build_routes(const ServerOptions& options, const TemplatePaths& paths) {
    const std::string& base = options.base_url.empty() ? std::string(DEFAULT_BASE_URL) : options.base_url;
    std::vector<Route> routes;

    Route kernel;
    kernel.pattern = url_path_join({base, std::string("/api/kernels/") + KERNEL_ID_REGEX});
    kernel.handler = HandlerKind::Kernel;
    routes.push_back(kernel);

    Route channels;
    channels.pattern = url_path_join({base, std::string("/api/kernels/") + KERNEL_ID_REGEX + "/channels"});
    channels.handler = HandlerKind::KernelChannels;
    routes.push_back(channels);

    Route statics;
    statics.pattern = url_path_join({base, STATIC_ROUTE});
    statics.handler = HandlerKind::StaticFiles;
    statics.static_paths = paths.static_paths;
    statics.default_filename = DEFAULT_STATIC_FILENAME;
    routes.push_back(statics);

    if (options.notebook_path) {
        Route render;
        render.pattern = url_path_join({base, "/"});
        render.handler = HandlerKind::Render;
        render.notebook_path = options.notebook_path;
        render.strip_sources = options.strip_sources;
        render.conversion_template_paths = paths.conversion_template_paths;
        routes.push_back(render);
    } else {
        Route root;
        root.pattern = base;
        root.handler = HandlerKind::Tree;
        routes.push_back(root);

        Route tree;
        tree.pattern = url_path_join({base, std::string(TREE_ROUTE) + PATH_REGEX});
        tree.handler = HandlerKind::Tree;
        routes.push_back(tree);

        Route render;
        render.pattern = url_path_join({base, std::string(RENDER_ROUTE) + PATH_REGEX});
        render.handler = HandlerKind::Render;
        render.strip_sources = options.strip_sources;
        render.conversion_template_paths = paths.conversion_template_paths;
        routes.push_back(render);
    }

    return routes;
}
