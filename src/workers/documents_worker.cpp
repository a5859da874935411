#include <chronicle/common/ids.hpp>
#include <chronicle/execution/step_failure.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/workers/documents_worker.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace chronicle::workers {

using namespace chronicle::schema;
using chronicle::execution::step_failure;

namespace {

void check_expected_version(const document_row_t& row,
                            const std::optional<uint64_t>& expected) {
  if (expected && *expected != row.row_version) {
    throw step_failure{error_code::version_conflict,
                       fmt::format("document {} is at version {}, expected {}",
                                   row.id, row.row_version, *expected)};
  }
}

void require_claimable(const std::optional<document_row_t>& existing,
                       const tenant_scope_t& scope,
                       const id_t& execution_id) {
  if (!existing || existing->audit.source_event_id == execution_id) {
    return;
  }
  if (existing->audit.deleted_at ||
      !visible(scope, existing->user_id, existing->workspace_id)) {
    throw step_failure{error_code::scope_violation,
                       fmt::format("document {} belongs to another tenant",
                                   existing->id)};
  }
}

}  // namespace

documents_worker::documents_worker(worker_context context,
                                   document_repository& repository)
    : context_{context}, repository_{repository} {}

chronicle::dispatch::handler_result documents_worker::handle(
    const stored_event_t& event) {
  return run_worker(context_, kName, event, [&](const event_type_t&) {
    std::visit(
        overloaded{
            [&](const document_create_t& command) { create(event, command); },
            [&](const document_update_t& command) { update(event, command); },
            [&](const document_delete_t& command) { remove(event, command); },
            [&](const auto& other) {
              throw step_failure{
                  error_code::payload_mismatch,
                  fmt::format("{} carries {}", event.event.type,
                              payload_name(payload_t{other}))};
            }},
        event.event.data);
  });
}

void documents_worker::create(const stored_event_t& event,
                              const document_create_t& command) {
  const auto& execution_id = event.event.id;
  auto& journal = context_.journal;
  auto document_id = command.document_id.value_or(
      chronicle::common::make_deterministic_uuid("documents", execution_id));
  auto scope = make_tenant_scope(event.event);

  auto content = journal.run(execution_id, "store-content", [&] {
    require_claimable(repository_.get(document_id), scope, execution_id);
    return context_.objects.put(fmt::format("documents/{}/body", document_id),
                                make_bytes_view(command.content),
                                command.content_type);
  });

  auto row_version = journal.run(execution_id, "persist-row", [&] {
    auto now = chronicle::common::now_ms();
    auto row = document_row_t{};
    row.id = document_id;
    row.user_id = event.event.user_id.value_or("");
    row.workspace_id = event.event.scope.workspace_id;
    row.title = command.title;
    row.content = content;
    row.properties = command.properties;
    row.audit = row_audit_t{.source_event_id = execution_id,
                            .created_at = now,
                            .updated_at = now};
    auto existing = repository_.get(document_id);
    require_claimable(existing, scope, execution_id);
    if (existing) {
      row.row_version = existing->row_version;
      row.audit.created_at = existing->audit.created_at;
    }
    repository_.upsert(row);
    return row.row_version;
  });

  auto completed = make_completed(
      event, command_completed_t{.resource_id = document_id,
                                 .resource_version = row_version,
                                 .content = content,
                                 .summary = fmt::format("created document '{}'",
                                                        command.title)});
  journal.run(execution_id, "emit-completed",
              [&] { emit_completed(context_.publisher, completed); });
  journal.run(execution_id, "notify", [&] {
    notify_best_effort(context_.notifications, completed, "created");
  });
  spdlog::info("Document {} created by {}", document_id, execution_id);
}

void documents_worker::update(const stored_event_t& event,
                              const document_update_t& command) {
  const auto& execution_id = event.event.id;
  auto& journal = context_.journal;
  auto scope = make_tenant_scope(event.event);

  auto load = [&] {
    auto row = repository_.find(command.document_id, scope);
    if (!row) {
      throw step_failure{
          error_code::resource_not_found,
          fmt::format("document {} not found", command.document_id)};
    }
    return *row;
  };

  auto content = journal.run(execution_id, "store-content", [&] {
    auto current = load();
    check_expected_version(current, command.expected_version);
    if (!command.content) {
      return std::optional<object_ref_t>{};
    }
    auto content_type =
        command.content_type.value_or(current.content.content_type);
    return std::optional{context_.objects.put(
        fmt::format("documents/{}/{}", command.document_id, execution_id),
        make_bytes_view(*command.content), content_type)};
  });

  auto row = journal.run(execution_id, "persist-row", [&] {
    auto current = load();
    if (current.audit.source_event_id == execution_id) {
      return current;
    }
    check_expected_version(current, command.expected_version);
    if (command.title) {
      current.title = *command.title;
    }
    if (content) {
      current.content = *content;
    } else if (command.content_type) {
      current.content.content_type = *command.content_type;
    }
    ++current.row_version;
    current.audit.source_event_id = execution_id;
    current.audit.updated_at = chronicle::common::now_ms();
    repository_.upsert(current);
    return current;
  });

  auto completed = make_completed(
      event, command_completed_t{.resource_id = row.id,
                                 .resource_version = row.row_version,
                                 .content = row.content,
                                 .summary = fmt::format("updated {} to version {}",
                                                        row.id, row.row_version)});
  journal.run(execution_id, "emit-completed",
              [&] { emit_completed(context_.publisher, completed); });
  journal.run(execution_id, "notify", [&] {
    notify_best_effort(context_.notifications, completed, "updated");
  });
}

void documents_worker::remove(const stored_event_t& event,
                              const document_delete_t& command) {
  const auto& execution_id = event.event.id;
  auto& journal = context_.journal;
  auto scope = make_tenant_scope(event.event);

  auto row_version = journal.run(execution_id, "persist-row", [&] {
    if (auto previous = repository_.get(command.document_id);
        previous && previous->audit.deleted_at &&
        previous->audit.source_event_id == execution_id) {
      return previous->row_version;
    }
    auto row = repository_.find(command.document_id, scope);
    if (!row) {
      throw step_failure{
          error_code::resource_not_found,
          fmt::format("document {} not found", command.document_id)};
    }
    check_expected_version(*row, command.expected_version);
    auto now = chronicle::common::now_ms();
    ++row->row_version;
    row->audit.source_event_id = execution_id;
    row->audit.updated_at = now;
    row->audit.deleted_at = now;
    repository_.upsert(*row);
    return row->row_version;
  });

  auto completed = make_completed(
      event, command_completed_t{.resource_id = command.document_id,
                                 .resource_version = row_version,
                                 .summary = fmt::format("deleted {}",
                                                        command.document_id)});
  journal.run(execution_id, "emit-completed",
              [&] { emit_completed(context_.publisher, completed); });
  journal.run(execution_id, "notify", [&] {
    notify_best_effort(context_.notifications, completed, "deleted");
  });
}

}  // namespace chronicle::workers
