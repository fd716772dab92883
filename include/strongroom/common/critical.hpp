#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace strongroom::common {

/// Log a broken process invariant and terminate.
///
/// Reserved for failures the program cannot recover from (storage or
/// encoder faults). Instruction-level failures are returned as result codes.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace strongroom::common
