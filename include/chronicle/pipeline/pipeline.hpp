#pragma once

#include <chronicle/dispatch/dispatcher.hpp>
#include <chronicle/dispatch/handler_registry.hpp>
#include <chronicle/events/event_store.hpp>
#include <chronicle/events/publisher.hpp>
#include <chronicle/events/schema_registry.hpp>
#include <chronicle/execution/job_executor.hpp>
#include <chronicle/execution/job_runner.hpp>
#include <chronicle/execution/step_journal.hpp>
#include <chronicle/governor/governor.hpp>
#include <chronicle/governor/membership_directory.hpp>
#include <chronicle/ingress/command_gateway.hpp>
#include <chronicle/ingress/insight_tokens.hpp>
#include <chronicle/projections/materializer.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <chronicle/threads/thread_log.hpp>
#include <chronicle/workers/document_repository.hpp>
#include <chronicle/workers/documents_worker.hpp>
#include <chronicle/workers/entities_worker.hpp>
#include <chronicle/workers/entity_repository.hpp>
#include <chronicle/workers/membership_worker.hpp>
#include <chronicle/workers/notification_sink.hpp>
#include <chronicle/workers/object_store.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace chronicle::pipeline {

struct pipeline_options final {
  uint32_t max_attempts{3};
  std::chrono::milliseconds retry_backoff{0};
  std::size_t dispatch_threads{4};
  bool realtime{true};
  std::string webhook_secret;
};

/// The assembled command pipeline. Publishing appends an event and schedules
/// its dispatch on the job executor; handlers publish follow-up events
/// through the same path, so one submission runs through
/// requested -> validated|pending|denied -> completed without the caller
/// waiting.
class pipeline final : public chronicle::events::publisher {
 public:
  pipeline(chronicle::storage::rocksdb_storage_t& storage,
           chronicle::workers::object_store& objects,
           chronicle::workers::notification_sink& notifications,
           pipeline_options options = {});
  ~pipeline() override;

  pipeline(const pipeline&) = delete;
  pipeline& operator=(const pipeline&) = delete;

  chronicle::events::append_result publish(
      const chronicle::schema::event_t& event) override;

  /// Block until no dispatch is queued or running.
  void wait_idle();

  void shutdown();

  const chronicle::events::schema_registry& registry() const {
    return registry_;
  }
  chronicle::events::event_store& store() { return store_; }
  chronicle::governor::membership_directory& directory() { return directory_; }
  chronicle::governor::governor& permission_governor() { return governor_; }
  chronicle::dispatch::handler_registry& handlers() { return handlers_; }
  chronicle::execution::job_runner& runner() { return runner_; }
  chronicle::execution::step_journal& journal() { return journal_; }
  chronicle::workers::entity_repository& entities() { return entities_; }
  chronicle::workers::document_repository& documents() { return documents_; }
  chronicle::projections::materializer& projections() { return materializer_; }
  chronicle::threads::thread_log& threads() { return threads_; }
  chronicle::ingress::command_gateway& gateway() { return gateway_; }
  chronicle::ingress::insight_tokens& tokens() { return tokens_; }

 private:
  void register_handlers();
  chronicle::dispatch::handler_result notify_phase(
      const chronicle::schema::stored_event_t& event);

  pipeline_options options_;
  chronicle::events::schema_registry registry_;
  chronicle::events::event_store store_;
  chronicle::governor::membership_directory directory_;
  chronicle::dispatch::handler_registry handlers_;
  chronicle::dispatch::dispatcher dispatcher_;
  chronicle::execution::step_journal journal_;
  chronicle::execution::job_runner runner_;
  chronicle::workers::discarding_sink muted_;
  chronicle::workers::notification_sink& notifications_;
  chronicle::workers::entity_repository entities_;
  chronicle::workers::document_repository documents_;
  chronicle::governor::governor governor_;
  chronicle::workers::entities_worker entities_worker_;
  chronicle::workers::documents_worker documents_worker_;
  chronicle::workers::membership_worker membership_worker_;
  chronicle::projections::materializer materializer_;
  chronicle::threads::thread_log threads_;
  chronicle::ingress::command_gateway gateway_;
  chronicle::ingress::insight_tokens tokens_;
  chronicle::execution::job_executor executor_;
};

}  // namespace chronicle::pipeline
