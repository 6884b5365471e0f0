#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <templates/template_types.hpp>

enum class HandlerKind {
    Kernel,             // kernel lifecycle REST endpoint
    KernelChannels,     // websocket bridge to the kernel
    StaticFiles,        // multi-directory static file handler
    Render,             // renders a notebook through the conversion collaborator
    Tree,               // directory listing of notebooks
};

const char* handler_kind_name(HandlerKind kind);

// One entry of the table handed to the HTTP framework. Only the fields
// relevant to `handler` are set.
struct Route {
    std::string pattern;
    HandlerKind handler;

    std::vector<std::filesystem::path> static_paths;
    std::string default_filename;

    std::optional<std::string> notebook_path;
    std::optional<bool> strip_sources;
    std::vector<std::filesystem::path> conversion_template_paths;
};

// Kernel messages the frontend may send through the channels route.
const std::vector<std::string>& allowed_kernel_message_types();

// Join URL segments with exactly one '/' between them. The first segment's
// leading '/' and the last segment's trailing '/' are preserved.
std::string url_path_join(const std::vector<std::string>& pieces);

// Notebook mode when options.notebook_path is set, tree mode otherwise.
std::vector<Route> build_routes(const ServerOptions& options, const TemplatePaths& paths);
