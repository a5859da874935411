#pragma once

#include <chronicle/schema/event.hpp>

#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::dispatch {

/// What a handler reports back. Throwing is equivalent to returning
/// `success = false` with the exception message.
struct handler_result final {
  bool success{true};
  std::string message;
};

using handler_t =
    std::function<handler_result(const chronicle::schema::stored_event_t&)>;

struct registered_handler final {
  std::string name;
  std::string pattern;
  handler_t handler;
};

/// Subscriptions by event type. A pattern is an exact type or a three
/// segment dot path in which `*` matches any single segment, for example
/// `*.*.requested` or `entities.*.validated`.
class handler_registry final {
 public:
  /// Returns false for a malformed pattern or a duplicate handler name.
  bool add(std::string name, std::string pattern, handler_t handler);

  std::vector<registered_handler> match(const std::string_view type) const;

  std::size_t size() const;

  static bool matches(const std::string_view pattern,
                      const std::string_view type);

  static bool valid_pattern(const std::string_view pattern);

 private:
  mutable std::mutex mutex_;
  std::vector<registered_handler> handlers_;
};

}  // namespace chronicle::dispatch
