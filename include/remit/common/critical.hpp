#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace remit::common {

[[noreturn]] inline void terminate_after_fault() {
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// Log a fatal fault and terminate the process.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  terminate_after_fault();
}

/// Formatted variant: `critical("open {} failed: {}", path, status)`.
template <typename Arg, typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Arg>(arg),
                   std::forward<Args>(args)...);
  terminate_after_fault();
}

}  // namespace remit::common
