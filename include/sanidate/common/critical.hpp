#pragma once
#include <spdlog/spdlog.h>
#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

namespace sanidate::common {

/// Logs, flushes every logger and terminates. For failures after which the
/// process cannot keep serving checks (storage unreachable or corrupt).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace sanidate::common
