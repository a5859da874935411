#pragma once

#include <chronicle/dispatch/handler_registry.hpp>
#include <chronicle/events/event_store.hpp>
#include <chronicle/events/publisher.hpp>
#include <chronicle/execution/job_runner.hpp>
#include <chronicle/execution/step_journal.hpp>
#include <chronicle/schema/command_completed.hpp>
#include <chronicle/schema/event.hpp>
#include <chronicle/schema/event_type.hpp>
#include <chronicle/workers/notification_sink.hpp>
#include <chronicle/workers/object_store.hpp>

#include <functional>
#include <optional>
#include <string_view>

namespace chronicle::workers {

/// Collaborators shared by every execution worker.
struct worker_context final {
  chronicle::events::publisher& publisher;
  chronicle::execution::step_journal& journal;
  chronicle::execution::job_runner& runner;
  object_store& objects;
  notification_sink& notifications;
};

/// `{subject}.{action}.completed` for a validated event. The id is derived
/// from the validated event so a replayed emit step appends nothing new.
chronicle::schema::event_t make_completed(
    const chronicle::schema::stored_event_t& validated,
    chronicle::schema::command_completed_t result);

/// Publish a completion; an already appended completion counts as success.
void emit_completed(chronicle::events::publisher& publisher,
                    const chronicle::schema::event_t& completed);

/// Parse and check a validated event for `subject`, run `body` under the job
/// runner and fold the outcome into a handler result.
chronicle::dispatch::handler_result run_worker(
    worker_context& context,
    const std::string_view worker,
    const chronicle::schema::stored_event_t& event,
    const std::function<void(const chronicle::schema::event_type_t&)>& body);

}  // namespace chronicle::workers
