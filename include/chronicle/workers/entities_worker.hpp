#pragma once

#include <chronicle/dispatch/handler_registry.hpp>
#include <chronicle/schema/entity_create.hpp>
#include <chronicle/schema/entity_delete.hpp>
#include <chronicle/schema/entity_update.hpp>
#include <chronicle/workers/entity_repository.hpp>
#include <chronicle/workers/worker_context.hpp>

#include <string_view>

namespace chronicle::workers {

/// Executes validated `entities.*` commands as memoized steps keyed by the
/// validated event id.
class entities_worker final {
 public:
  static constexpr auto kName = std::string_view{"entities-worker"};
  static constexpr auto kPattern = std::string_view{"entities.*.validated"};

  entities_worker(worker_context context, entity_repository& repository);

  chronicle::dispatch::handler_result handle(
      const chronicle::schema::stored_event_t& event);

 private:
  void create(const chronicle::schema::stored_event_t& event,
              const chronicle::schema::entity_create_t& command);
  void update(const chronicle::schema::stored_event_t& event,
              const chronicle::schema::entity_update_t& command);
  void remove(const chronicle::schema::stored_event_t& event,
              const chronicle::schema::entity_delete_t& command);

  worker_context context_;
  entity_repository& repository_;
};

}  // namespace chronicle::workers
