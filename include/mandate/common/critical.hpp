#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace mandate::common {

/// Log an unrecoverable infrastructure failure and bring the process down.
///
/// Reserved for broken storage and undecodable persisted state; request
/// validation failures are reported through result codes instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace mandate::common
