#pragma once
#include <atomic>
#include <cstdio>
#include <fmt/color.h>
#include <fmt/core.h>
#include <string_view>
#include <utility>

enum class log_level { debug, info, warn, error, off };

inline std::atomic<log_level> current_log_level{log_level::info};

// Accepts "debug", "info", "warn", "error" and "off". Anything else,
// including a null pointer, leaves the level unchanged and returns false.
bool set_log_level(const char* name);

namespace detail {
void write_log(log_level level, std::string_view message);
} // namespace detail

inline bool log_enabled(log_level level) {
  return level >= current_log_level.load(std::memory_order_relaxed);
}

template<typename... Args>
void log_at(log_level level, fmt::format_string<Args...> format, Args&&... args) {
  if (log_enabled(level)) {
    detail::write_log(level, fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void log_debug(fmt::format_string<Args...> format, Args&&... args) {
  log_at(log_level::debug, format, std::forward<Args>(args)...);
}

template<typename... Args>
void log_info(fmt::format_string<Args...> format, Args&&... args) {
  log_at(log_level::info, format, std::forward<Args>(args)...);
}

template<typename... Args>
void log_warn(fmt::format_string<Args...> format, Args&&... args) {
  log_at(log_level::warn, format, std::forward<Args>(args)...);
}

template<typename... Args>
void log_error(fmt::format_string<Args...> format, Args&&... args) {
  log_at(log_level::error, format, std::forward<Args>(args)...);
}
