#include <chronicle/pipeline/pipeline.hpp>
#include <chronicle/schema/event_type.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace chronicle::pipeline {

using namespace chronicle::schema;

pipeline::pipeline(chronicle::storage::rocksdb_storage_t& storage,
                   chronicle::workers::object_store& objects,
                   chronicle::workers::notification_sink& notifications,
                   pipeline_options options)
    : options_{std::move(options)},
      store_{storage, registry_},
      directory_{storage},
      dispatcher_{handlers_},
      journal_{storage},
      runner_{storage, store_, options_.max_attempts, options_.retry_backoff},
      notifications_{options_.realtime
                         ? notifications
                         : static_cast<chronicle::workers::notification_sink&>(
                               muted_)},
      entities_{storage},
      documents_{storage},
      governor_{store_, directory_, *this},
      entities_worker_{chronicle::workers::worker_context{
                           *this, journal_, runner_, objects, notifications_},
                       entities_},
      documents_worker_{chronicle::workers::worker_context{
                            *this, journal_, runner_, objects, notifications_},
                        documents_},
      membership_worker_{chronicle::workers::worker_context{
                             *this, journal_, runner_, objects, notifications_},
                         directory_},
      materializer_{storage},
      threads_{storage},
      gateway_{registry_, *this, options_.webhook_secret},
      tokens_{gateway_},
      executor_{options_.dispatch_threads} {
  chronicle::events::register_default_schemas(registry_);
  register_handlers();
  spdlog::info("Pipeline ready: {} event type(s), {} handler(s)",
               registry_.registered_types().size(), handlers_.size());
}

pipeline::~pipeline() {
  shutdown();
}

void pipeline::register_handlers() {
  handlers_.add("permission-governor", "*.*.requested",
                [this](const stored_event_t& event) {
                  auto outcome = runner_.run("permission-governor", event, [&] {
                    governor_.process(event);
                  });
                  return chronicle::dispatch::handler_result{
                      .success = outcome.success,
                      .message = outcome.success ? "decided"
                                                 : outcome.last_error};
                });

  auto entities = [this](const stored_event_t& event) {
    return entities_worker_.handle(event);
  };
  handlers_.add(std::string{chronicle::workers::entities_worker::kName},
                std::string{chronicle::workers::entities_worker::kPattern},
                entities);

  handlers_.add(std::string{chronicle::workers::documents_worker::kName},
                std::string{chronicle::workers::documents_worker::kPattern},
                [this](const stored_event_t& event) {
                  return documents_worker_.handle(event);
                });

  for (auto pattern : chronicle::workers::membership_worker::kPatterns) {
    handlers_.add(fmt::format("{}:{}",
                              chronicle::workers::membership_worker::kName,
                              pattern),
                  std::string{pattern}, [this](const stored_event_t& event) {
                    return membership_worker_.handle(event);
                  });
  }

  handlers_.add(std::string{chronicle::projections::materializer::kName},
                std::string{chronicle::projections::materializer::kPattern},
                [this](const stored_event_t& event) {
                  return materializer_.handle(event);
                });

  if (options_.realtime) {
    for (auto phase : {"validated", "pending", "denied"}) {
      handlers_.add(fmt::format("realtime-bridge:{}", phase),
                    fmt::format("*.*.{}", phase),
                    [this](const stored_event_t& event) {
                      return notify_phase(event);
                    });
    }
  }
}

chronicle::dispatch::handler_result pipeline::notify_phase(
    const stored_event_t& event) {
  auto message = std::string{};
  if (event.event.metadata.approval) {
    const auto& decision = *event.event.metadata.approval;
    message = decision.needs_approval ? "awaiting approval: " + decision.reason
                                      : decision.reason;
  }
  auto delivered = chronicle::workers::notify_best_effort(
      notifications_, event.event, message);
  // A dropped notification is already logged and never fails the pipeline.
  return {.success = true,
          .message = delivered ? "notified" : "notification dropped"};
}

chronicle::events::append_result pipeline::publish(const event_t& event) {
  auto appended = store_.append(event);
  if (appended.code != 0) {
    return appended;
  }
  auto stored = *appended.stored;
  spdlog::info("Appended {} {} (seq {})", stored.event.type, stored.event.id,
               stored.sequence);
  auto scheduled = executor_.submit([this, stored = std::move(stored)] {
    auto summary = dispatcher_.dispatch(stored);
    if (summary.failed > 0) {
      spdlog::warn("{} {}: {} handler(s) failed, {} succeeded",
                   summary.event_type, summary.event_id, summary.failed,
                   summary.successful);
    }
  });
  if (!scheduled) {
    spdlog::warn("Pipeline shutting down; {} appended but not dispatched",
                 event.id);
  }
  return appended;
}

void pipeline::wait_idle() {
  executor_.wait_idle();
}

void pipeline::shutdown() {
  executor_.shutdown();
}

}  // namespace chronicle::pipeline
