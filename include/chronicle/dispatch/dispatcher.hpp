#pragma once

#include <chronicle/dispatch/handler_registry.hpp>
#include <chronicle/schema/event.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace chronicle::dispatch {

enum class handler_status : uint8_t { succeeded = 0, failed = 1 };

struct handler_outcome final {
  std::string handler;
  handler_status status{handler_status::succeeded};
  std::string message;
};

struct dispatch_summary final {
  chronicle::schema::id_t event_id;
  std::string event_type;
  uint32_t successful{};
  uint32_t failed{};
  std::vector<handler_outcome> outcomes;
};

/// Runs every handler subscribed to an event concurrently and settles all
/// of them. A failing handler is reported in the summary and never affects
/// the others.
class dispatcher final {
 public:
  explicit dispatcher(const handler_registry& registry);

  dispatch_summary dispatch(const chronicle::schema::stored_event_t& event) const;

 private:
  const handler_registry& registry_;
};

}  // namespace chronicle::dispatch
