#include "log.hpp"
#include <cstring>
#include <mutex>

bool set_log_level(const char* name) {
  constexpr static struct { const char* name; log_level level; } levels[] = {
    { "debug", log_level::debug },
    { "info", log_level::info },
    { "warn", log_level::warn },
    { "error", log_level::error },
    { "off", log_level::off },
  };
  if (!name) {
    return false;
  }
  for (auto [n, level]: levels) {
    if (std::strcmp(n, name) == 0) {
      current_log_level.store(level, std::memory_order_relaxed);
      return true;
    }
  }
  return false;
}

namespace detail {
void write_log(log_level level, std::string_view message) {
  static std::mutex mutex;
  std::string_view tag = "?";
  fmt::text_style style;
  switch (level) {
    case log_level::debug: tag = "debug"; style = fg(fmt::color::gray); break;
    case log_level::info: tag = "info"; break;
    case log_level::warn: tag = "warn"; style = fg(fmt::color::yellow); break;
    case log_level::error: tag = "error"; style = fg(fmt::color::red); break;
    case log_level::off: return;
  }
  std::lock_guard lk(mutex);
  fmt::print(stderr, "[{}] {}\n", fmt::styled(tag, style), message);
}
} // namespace detail
