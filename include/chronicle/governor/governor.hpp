#pragma once

#include <chronicle/events/event_store.hpp>
#include <chronicle/events/publisher.hpp>
#include <chronicle/governor/membership_directory.hpp>
#include <chronicle/schema/event.hpp>
#include <chronicle/schema/permission_decision.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chronicle::governor {

struct resolution_result final {
  uint32_t code{};
  std::string log;
  std::optional<chronicle::schema::id_t> event_id;
};

/// Permission governor. Turns every `*.*.requested` event into exactly one
/// `validated`, `pending` or `denied` event carrying the original data.
class governor final {
 public:
  governor(chronicle::events::event_store& store,
           const membership_directory& directory,
           chronicle::events::publisher& publisher);

  /// Pure decision for a requested event; reads memberships and workspace
  /// settings but writes nothing.
  chronicle::schema::permission_decision_t decide(
      const chronicle::schema::event_t& event) const;

  /// Decide, record the decision on the requested event and publish the
  /// phase event. Returns the id of the published event.
  std::optional<chronicle::schema::id_t> process(
      const chronicle::schema::stored_event_t& requested);

  /// Human resolution of a pending command. Approval resubmits the original
  /// command as a new requested event on behalf of the approver; rejection
  /// publishes the denied event.
  resolution_result resolve_pending(const std::string_view pending_event_id,
                                    const std::string_view approver_id,
                                    const bool approve);

 private:
  /// Mark the pending event with the outcome of its published resolution.
  void record_resolution(const std::string_view pending_event_id,
                         const std::string_view resolution_id);

  chronicle::events::event_store& store_;
  const membership_directory& directory_;
  chronicle::events::publisher& publisher_;
};

}  // namespace chronicle::governor
