#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace keystone::common {

/// Report a host-side fault the process cannot continue past and stop.
///
/// Never used on the program path: program failures are returned as
/// `program_result` values so the host can discard the invocation.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace keystone::common
