#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::config {

struct options final {
  std::string data_dir{"./chronicle-data"};
  std::string object_dir;
  std::string log_level{"info"};
  std::string log_file{"chronicle.log"};
  std::string webhook_secret;
  uint32_t max_attempts{3};
  uint32_t dispatch_threads{4};
  bool realtime{true};

  // Operator commands; at most one runs per invocation.
  std::optional<std::string> stream_subject;
  std::optional<std::string> verify_thread;
  bool rebuild_projections{};
  std::optional<uint64_t> rebuild_from;
  bool list_failures{};
};

struct parse_result final {
  /// Set when parsing failed; `usage` then holds the message to print.
  bool error{};
  /// Help was requested or parsing failed; the caller should print `usage`
  /// and exit.
  bool exit{};
  std::string usage;
  options values;
};

/// Command line first, then the INI file named by `--config`; values given
/// on the command line win.
parse_result parse(int argc, const char* const argv[]);

}  // namespace chronicle::config
