#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

// Fatal path for infallible APIs handed input they cannot represent.
// Callers that can recover use the matching try_ function instead.
namespace wormhole::common {

[[noreturn]] inline void terminate_process() {
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  terminate_process();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  terminate_process();
}

}  // namespace wormhole::common
