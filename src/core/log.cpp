#include "log.hpp"
#include <platform/platform.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

static std::atomic<LogLevel> g_level{LogLevel::Info};
static std::atomic<bool> g_echo{true};
static std::mutex g_log_mutex;

std::string folio_log_path() {
    static std::string path = (platform::temp_dir() / "folio_debug.log").string();
    return path;
}

void set_log_level(LogLevel level) { g_level = level; }
void set_log_echo(bool enabled) { g_echo = enabled; }

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
    std::string up = s;
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (up == "DEBUG" || up == "10") return LogLevel::Debug;
    if (up == "INFO" || up == "20") return LogLevel::Info;
    if (up == "WARN" || up == "WARNING" || up == "30") return LogLevel::Warning;
    if (up == "ERROR" || up == "40") return LogLevel::Error;
    return std::nullopt;
}

static std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()));
}

void folio_log(LogLevel level, const std::string& msg) {
    std::string line = fmt::format("[{} {}] {}", log_level_name(level)[0], timestamp(), msg);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    {
        std::ofstream out(folio_log_path(), std::ios::app);
        if (out) out << line << "\n";
    }
    if (g_echo && level >= g_level) {
        std::cerr << line << "\n";
    }
}
