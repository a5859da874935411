#include <chronicle/dispatch/dispatcher.hpp>

#include <spdlog/spdlog.h>

#include <future>

namespace chronicle::dispatch {

namespace {

handler_outcome settle(const std::string& name,
                       std::future<handler_result>& pending) {
  auto outcome = handler_outcome{.handler = name};
  try {
    auto result = pending.get();
    outcome.status =
        result.success ? handler_status::succeeded : handler_status::failed;
    outcome.message = std::move(result.message);
  } catch (const std::exception& ex) {
    outcome.status = handler_status::failed;
    outcome.message = ex.what();
  } catch (...) {
    outcome.status = handler_status::failed;
    outcome.message = "unknown exception";
  }
  return outcome;
}

}  // namespace

dispatcher::dispatcher(const handler_registry& registry)
    : registry_{registry} {}

dispatch_summary dispatcher::dispatch(
    const chronicle::schema::stored_event_t& event) const {
  auto handlers = registry_.match(event.event.type);
  auto summary = dispatch_summary{.event_id = event.event.id,
                                  .event_type = event.event.type};
  if (handlers.empty()) {
    spdlog::debug("No handlers for {} ({})", event.event.type, event.event.id);
    return summary;
  }

  auto pending = std::vector<std::future<handler_result>>{};
  pending.reserve(handlers.size());
  for (const auto& entry : handlers) {
    pending.push_back(std::async(std::launch::async,
                                 [&entry, &event] { return entry.handler(event); }));
  }

  for (auto i = size_t{0}; i < handlers.size(); ++i) {
    auto outcome = settle(handlers[i].name, pending[i]);
    if (outcome.status == handler_status::succeeded) {
      ++summary.successful;
    } else {
      ++summary.failed;
      spdlog::error("Handler '{}' failed on {} ({}): {}", outcome.handler,
                    event.event.type, event.event.id, outcome.message);
    }
    summary.outcomes.push_back(std::move(outcome));
  }
  spdlog::debug("Dispatched {} ({}): {} ok, {} failed", event.event.type,
                event.event.id, summary.successful, summary.failed);
  return summary;
}

}  // namespace chronicle::dispatch
