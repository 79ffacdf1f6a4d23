#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging shared by the engine and the CLI.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - WARN/ERROR go to stderr, DEBUG/INFO to stdout.
===========================================================
*/

#include <string>
#include <string_view>

namespace pythag {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default WARN so the CLI output stays clean).
void set_log_level(LogLevel lvl) noexcept;

LogLevel get_log_level() noexcept;

// Accepts "debug", "info", "warn", "error" (case-insensitive).
// Returns false and leaves *out untouched on unknown text.
bool parse_log_level(std::string_view text, LogLevel* out) noexcept;

const char* log_level_name(LogLevel lvl) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

inline void log_debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
inline void log_info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
inline void log_warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
inline void log_error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }

} // namespace pythag
