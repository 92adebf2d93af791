/*
===========================================================
Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
*/

#include "engine/core/logging.hpp"

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace clirisk {
namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
std::array<std::atomic<std::size_t>, 4> g_emitted{};

// Guards the sink pointers and serializes writes.
std::mutex g_log_mu;
std::ostream* g_sink = nullptr;  // nullptr => stdout/stderr split

int level_index(LogLevel lvl) noexcept {
  const int i = static_cast<int>(lvl);
  return (i < 0) ? 0 : (i > 3 ? 3 : i);
}

bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

void write_utc_timestamp(std::ostream& out) {
  using clock = std::chrono::system_clock;
  const std::time_t tt = clock::to_time_t(clock::now());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
}

} // namespace

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
  if (iequals(text, "debug")) { *out = LogLevel::DEBUG; return true; }
  if (iequals(text, "info"))  { *out = LogLevel::INFO;  return true; }
  if (iequals(text, "warn") || iequals(text, "warning")) { *out = LogLevel::WARN; return true; }
  if (iequals(text, "error")) { *out = LogLevel::ERROR; return true; }
  return false;
}

void set_log_sink(std::ostream* sink) noexcept {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_sink = sink;
}

std::size_t log_emitted(LogLevel lvl) noexcept {
  return g_emitted[level_index(lvl)].load(std::memory_order_relaxed);
}

void reset_log_counters() noexcept {
  for (auto& c : g_emitted) c.store(0, std::memory_order_relaxed);
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
  g_emitted[level_index(lvl)].fetch_add(1, std::memory_order_relaxed);

  try {
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::ostream& out = g_sink ? *g_sink : ((lvl >= LogLevel::WARN) ? std::cerr : std::cout);
    out << "[";
    write_utc_timestamp(out);
    out << "][" << log_level_name(lvl) << "] " << msg << "\n";
    out.flush();
  } catch (const std::exception&) {
    // Logging never throws; a failing stream only loses the line.
  } catch (...) {
    // std::system_error from the mutex is the only other source.
  }
}

} // namespace clirisk
