#pragma once

// ── Template packages ───────────────────────────────────────
// On-disk layout of a template package: <root>/<name>/{conf.json,templates,static,nbconvert_templates}
constexpr const char* DEFAULT_TEMPLATE_NAME        = "default";
constexpr const char* TEMPLATE_MANIFEST_FILE       = "conf.json";
constexpr const char* MANIFEST_BASE_TEMPLATE_KEY   = "base_template";
constexpr const char* TEMPLATE_PAGES_SUBDIR        = "templates";
constexpr const char* TEMPLATE_STATIC_SUBDIR       = "static";
constexpr const char* TEMPLATE_CONVERSION_SUBDIR   = "nbconvert_templates";

// ── Data directories ────────────────────────────────────────
// Relative to a jupyter data root (e.g. ~/.local/share/jupyter)
constexpr const char* DATA_APP_DIR                 = "folio";
constexpr const char* DATA_TEMPLATE_DIR            = "template";
constexpr const char* SHARE_JUPYTER_DIR            = "share/jupyter";

// ── Server defaults ─────────────────────────────────────────
constexpr int DEFAULT_PORT                         = 8866;
constexpr const char* DEFAULT_BASE_URL             = "/";
constexpr const char* DEFAULT_STATIC_FILENAME      = "index.html";
constexpr const char* CONNECTION_DIR_PREFIX        = "folio_";

// ── Routes ──────────────────────────────────────────────────
constexpr const char* KERNEL_ID_REGEX   = R"((?P<kernel_id>\w+-\w+-\w+-\w+-\w+))";
constexpr const char* PATH_REGEX        = R"((?P<path>(?:(?:/[^/]+)+|/?)))";
constexpr const char* STATIC_ROUTE      = "/folio/static/(.*)";
constexpr const char* TREE_ROUTE        = "/folio/tree";
constexpr const char* RENDER_ROUTE      = "/folio/render";

// ── Config files ────────────────────────────────────────────
constexpr const char* GLOBAL_CONFIG_DIR  = ".folio";
constexpr const char* GLOBAL_CONFIG_FILE = "config.yaml";
constexpr const char* PROJECT_CONFIG_FILE = "folio.yaml";

constexpr const char* FOLIO_VERSION = "0.1.0";
