#include <chronicle/common/ids.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/workers/worker_context.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace chronicle::workers {

using namespace chronicle::schema;

event_t make_completed(const stored_event_t& validated,
                       command_completed_t result) {
  const auto& origin = validated.event;
  auto type = parse_event_type(origin.type);
  if (!type) {
    throw std::invalid_argument{
        fmt::format("malformed event type '{}'", origin.type)};
  }

  auto completed = event_t{};
  completed.id = chronicle::common::make_deterministic_uuid("completed",
                                                            origin.id);
  completed.type = with_phase(*type, phase_t::completed);
  completed.subject_id = result.resource_id;
  completed.subject_type = origin.subject_type ? origin.subject_type
                                               : std::optional{type->subject};
  completed.user_id = origin.user_id;
  completed.source = origin.source;
  completed.timestamp = chronicle::common::now_ms();
  completed.scope = origin.scope;
  completed.trace.correlation_id =
      origin.trace.correlation_id.value_or(origin.id);
  completed.trace.causation_id = origin.id;
  completed.trace.request_id = origin.trace.request_id;
  // Provenance travels with the result so projections can read it.
  completed.metadata.ai = origin.metadata.ai;
  completed.metadata.import_context = origin.metadata.import_context;
  completed.metadata.sync = origin.metadata.sync;
  completed.metadata.automation = origin.metadata.automation;
  result.validated_event_id = origin.id;
  completed.data = std::move(result);
  return completed;
}

void emit_completed(chronicle::events::publisher& publisher,
                    const event_t& completed) {
  auto published = publisher.publish(completed);
  if (published.code == to_code(error_code::duplicate_event)) {
    spdlog::debug("{} {} already emitted", completed.type, completed.id);
    return;
  }
  if (published.code != 0) {
    throw std::runtime_error{fmt::format("failed to emit {}: {}",
                                         completed.type, published.log)};
  }
}

chronicle::dispatch::handler_result run_worker(
    worker_context& context,
    const std::string_view worker,
    const stored_event_t& event,
    const std::function<void(const event_type_t&)>& body) {
  auto type = parse_event_type(event.event.type);
  if (!type || type->phase != phase_t::validated) {
    return {.success = false,
            .message = fmt::format("{} cannot execute {}", worker,
                                   event.event.type)};
  }
  auto outcome = context.runner.run(worker, event, [&] { body(*type); });
  if (!outcome.success) {
    return {.success = false, .message = outcome.last_error};
  }
  return {.success = true,
          .message = fmt::format("{} executed {}", worker, event.event.type)};
}

}  // namespace chronicle::workers
