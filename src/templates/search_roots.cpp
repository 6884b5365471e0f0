#include "search_roots.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <algorithm>

#ifndef FOLIO_SOURCE_DIR
#define FOLIO_SOURCE_DIR "."
#endif

#ifndef FOLIO_INSTALL_PREFIX
#define FOLIO_INSTALL_PREFIX "/usr/local"
#endif

static void add_unique(std::vector<fs::path>& paths, const fs::path& p) {
    fs::path normal = p.lexically_normal();
    bool seen = std::any_of(paths.begin(), paths.end(),
                            [&](const fs::path& q) { return q.lexically_normal() == normal; });
    if (!seen) paths.push_back(p);
}

fs::path jupyter_data_dir() {
    if (auto dir = platform::env("JUPYTER_DATA_DIR")) {
        return fs::path(*dir);
    }
#ifdef __APPLE__
    return platform::home_dir() / "Library" / "Jupyter";
#else
    if (auto xdg = platform::env("XDG_DATA_HOME")) {
        return fs::path(*xdg) / "jupyter";
    }
    return platform::home_dir() / ".local" / "share" / "jupyter";
#endif
}

std::vector<fs::path> jupyter_path(const std::vector<std::string>& subdirs) {
    std::vector<fs::path> roots;

    if (auto extra = platform::env("JUPYTER_PATH")) {
        for (const auto& entry : split(*extra, platform::path_list_separator())) {
            add_unique(roots, fs::path(entry));
        }
    }
    add_unique(roots, jupyter_data_dir());
    add_unique(roots, fs::path(FOLIO_INSTALL_PREFIX) / SHARE_JUPYTER_DIR);
#ifndef _WIN32
    add_unique(roots, fs::path("/usr/local") / SHARE_JUPYTER_DIR);
    add_unique(roots, fs::path("/usr") / SHARE_JUPYTER_DIR);
#endif

    std::vector<fs::path> result;
    for (const auto& root : roots) {
        fs::path p = root;
        for (const auto& sub : subdirs) p /= sub;
        add_unique(result, p);
    }
    return result;
}

fs::path development_data_dir() {
    return (fs::absolute(FOLIO_SOURCE_DIR) / SHARE_JUPYTER_DIR / DATA_APP_DIR).lexically_normal();
}

std::vector<fs::path> template_search_roots(const std::vector<fs::path>& extra_dirs) {
    std::vector<fs::path> roots;
    for (const auto& dir : extra_dirs) {
        add_unique(roots, dir);
    }

    std::error_code ec;
    fs::path dev = development_data_dir() / DATA_TEMPLATE_DIR;
    if (fs::is_directory(dev, ec)) {
        add_unique(roots, dev);
    }

    for (const auto& p : jupyter_path({DATA_APP_DIR, DATA_TEMPLATE_DIR})) {
        add_unique(roots, p);
    }
    return roots;
}

fs::path builtin_static_dir() {
    std::error_code ec;
    fs::path dev = development_data_dir() / "static";
    if (fs::is_directory(dev, ec)) {
        return dev;
    }
    return fs::path(FOLIO_INSTALL_PREFIX) / SHARE_JUPYTER_DIR / DATA_APP_DIR / "static";
}
