#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace arkive::common {

// Log and terminate. Reserved for states where the connection or process
// can no longer be trusted (for example a ROLLBACK that did not apply).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace arkive::common
