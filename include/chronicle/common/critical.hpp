#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace chronicle::common {

/// Log an unrecoverable fault, flush every sink and terminate the process.
///
/// Used for storage and encoding failures where continuing would corrupt the
/// event log or leave derived state inconsistent with it.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// Same as critical(), with the failing subsystem named in the message.
[[noreturn]] inline void critical(const std::string_view subsystem,
                                  const std::string_view message) {
  spdlog::critical("[{}] {}", subsystem, message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace chronicle::common
