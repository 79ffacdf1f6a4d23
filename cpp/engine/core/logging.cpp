/*
===========================================================
Fragment 1.1 — Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace pythag {

static std::atomic<int> g_level{static_cast<int>(LogLevel::WARN)};
static std::mutex g_log_mu;

const char* log_level_name(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool parse_log_level(std::string_view text, LogLevel* out) noexcept {
  if (!out) return false;

  char buf[8] = {};
  if (text.empty() || text.size() >= sizeof(buf)) return false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    buf[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
  }
  const std::string_view t(buf, text.size());

  if (t == "debug") { *out = LogLevel::DEBUG; return true; }
  if (t == "info")  { *out = LogLevel::INFO;  return true; }
  if (t == "warn")  { *out = LogLevel::WARN;  return true; }
  if (t == "error") { *out = LogLevel::ERROR; return true; }
  return false;
}

static std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  std::time_t tt = clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  try {
    const int cur = g_level.load(std::memory_order_relaxed);
    if (static_cast<int>(lvl) < cur) return;

    std::lock_guard<std::mutex> lk(g_log_mu);

    std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
    out << "[" << utc_timestamp() << "]"
        << "[" << log_level_name(lvl) << "] "
        << msg << "\n";
    out.flush();
  } catch (const std::exception&) {
    // Logging is best-effort; a failed write must not take down the caller.
  }
}

} // namespace pythag
