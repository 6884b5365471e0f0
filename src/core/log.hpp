#pragma once

#include <string>
#include <optional>
#include <fmt/format.h>
#include "types.hpp"

// Debug log file: <tmp>/folio_debug.log. Every message is appended here
// regardless of level.
std::string folio_log_path();

// Messages at or above this level are echoed to stderr.
void set_log_level(LogLevel level);

// Turn stderr echo off entirely (tests).
void set_log_echo(bool enabled);

const char* log_level_name(LogLevel level);

// Accepts DEBUG, INFO, WARN, WARNING, ERROR (any case) or the numeric
// python-style levels 10/20/30/40.
std::optional<LogLevel> parse_log_level(const std::string& s);

void folio_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg)   { folio_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)    { folio_log(LogLevel::Info, msg); }
inline void log_warning(const std::string& msg) { folio_log(LogLevel::Warning, msg); }
inline void log_error(const std::string& msg)   { folio_log(LogLevel::Error, msg); }
