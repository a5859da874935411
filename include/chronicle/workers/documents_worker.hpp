#pragma once

#include <chronicle/dispatch/handler_registry.hpp>
#include <chronicle/schema/document_create.hpp>
#include <chronicle/schema/document_delete.hpp>
#include <chronicle/schema/document_update.hpp>
#include <chronicle/workers/document_repository.hpp>
#include <chronicle/workers/worker_context.hpp>

#include <string_view>

namespace chronicle::workers {

/// Executes validated `documents.*` commands. Document bodies always live in
/// the object store; the row keeps the reference and checksum.
class documents_worker final {
 public:
  static constexpr auto kName = std::string_view{"documents-worker"};
  static constexpr auto kPattern = std::string_view{"documents.*.validated"};

  documents_worker(worker_context context, document_repository& repository);

  chronicle::dispatch::handler_result handle(
      const chronicle::schema::stored_event_t& event);

 private:
  void create(const chronicle::schema::stored_event_t& event,
              const chronicle::schema::document_create_t& command);
  void update(const chronicle::schema::stored_event_t& event,
              const chronicle::schema::document_update_t& command);
  void remove(const chronicle::schema::stored_event_t& event,
              const chronicle::schema::document_delete_t& command);

  worker_context context_;
  document_repository& repository_;
};

}  // namespace chronicle::workers
