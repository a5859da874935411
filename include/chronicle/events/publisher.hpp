#pragma once

#include <chronicle/events/event_store.hpp>
#include <chronicle/schema/event.hpp>

namespace chronicle::events {

/// Entry point for events produced inside the pipeline (phase transitions,
/// completions, resubmissions). Implementations append the event and
/// schedule its dispatch.
class publisher {
 public:
  virtual ~publisher() = default;

  virtual append_result publish(const chronicle::schema::event_t& event) = 0;
};

}  // namespace chronicle::events
