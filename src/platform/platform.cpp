#include "platform.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <random>
#include <vector>
#include <fmt/format.h>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

Result<fs::path> make_temp_dir(const fs::path& parent, const std::string& prefix) {
    std::error_code ec;
    if (!fs::is_directory(parent, ec)) {
        return Result<fs::path>::Err(
            fmt::format("Cannot create temporary directory: {} is not a directory", parent.string()));
    }

#ifdef _WIN32
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)));
    std::uniform_int_distribution<int> dist(100000, 999999);
    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path p = parent / (prefix + std::to_string(dist(rng)));
        if (fs::create_directory(p, ec)) return Result<fs::path>::Ok(p);
    }
    return Result<fs::path>::Err("Cannot create temporary directory in " + parent.string());
#else
    std::string templ = (parent / (prefix + "XXXXXX")).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        return Result<fs::path>::Err(fmt::format("Cannot create temporary directory in {}: {}",
                                                 parent.string(), std::strerror(errno)));
    }
    return Result<fs::path>::Ok(fs::path(buf.data()));
#endif
}

char path_list_separator() {
#ifdef _WIN32
    return ';';
#else
    return ':';
#endif
}

} // namespace platform
