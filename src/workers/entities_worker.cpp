#include <chronicle/common/ids.hpp>
#include <chronicle/execution/step_failure.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/workers/entities_worker.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace chronicle::workers {

using namespace chronicle::schema;
using chronicle::execution::step_failure;

namespace {

constexpr auto kDoneStatus = std::string_view{"done"};

std::optional<object_ref_t> store_content(object_store& objects,
                                          const std::string_view prefix,
                                          const std::optional<std::string>& text,
                                          const std::optional<file_upload_t>& file) {
  if (file) {
    return objects.put(fmt::format("{}/{}", prefix, file->file_name),
                       make_bytes_view(file->content), file->content_type);
  }
  if (text) {
    return objects.put(fmt::format("{}/content", prefix),
                       make_bytes_view(*text), "text/plain");
  }
  return std::nullopt;
}

task_row_t make_task(const id_t& entity_id,
                     const task_fields_t& fields,
                     const timestamp_milliseconds_t now) {
  auto task = task_row_t{};
  task.entity_id = entity_id;
  task.status = fields.status;
  task.priority = fields.priority;
  task.due_at = fields.due_at;
  if (task.status == kDoneStatus) {
    task.completed_at = now;
  }
  return task;
}

void check_expected_version(const entity_row_t& row,
                            const std::optional<uint64_t>& expected) {
  if (expected && *expected != row.row_version) {
    throw step_failure{error_code::version_conflict,
                       fmt::format("entity {} is at version {}, expected {}",
                                   row.id, row.row_version, *expected)};
  }
}

/// A caller-chosen id may only name a new row, a row this execution already
/// wrote, or a live row the caller can see.
void require_claimable(const std::optional<entity_row_t>& existing,
                       const tenant_scope_t& scope,
                       const id_t& execution_id) {
  if (!existing || existing->audit.source_event_id == execution_id) {
    return;
  }
  if (existing->audit.deleted_at ||
      !visible(scope, existing->user_id, existing->workspace_id)) {
    throw step_failure{error_code::scope_violation,
                       fmt::format("entity {} belongs to another tenant",
                                   existing->id)};
  }
}

bool applied_by(const entity_row_t& row, const id_t& execution_id) {
  return row.audit.source_event_id == execution_id;
}

}  // namespace

entities_worker::entities_worker(worker_context context,
                                 entity_repository& repository)
    : context_{context}, repository_{repository} {}

chronicle::dispatch::handler_result entities_worker::handle(
    const stored_event_t& event) {
  return run_worker(context_, kName, event, [&](const event_type_t&) {
    std::visit(
        overloaded{
            [&](const entity_create_t& command) { create(event, command); },
            [&](const entity_update_t& command) { update(event, command); },
            [&](const entity_delete_t& command) { remove(event, command); },
            [&](const auto& other) {
              throw step_failure{
                  error_code::payload_mismatch,
                  fmt::format("{} carries {}", event.event.type,
                              payload_name(payload_t{other}))};
            }},
        event.event.data);
  });
}

void entities_worker::create(const stored_event_t& event,
                             const entity_create_t& command) {
  const auto& execution_id = event.event.id;
  auto& journal = context_.journal;
  auto entity_id = command.entity_id.value_or(
      chronicle::common::make_deterministic_uuid("entities", execution_id));
  auto scope = make_tenant_scope(event.event);

  auto content = journal.run(execution_id, "store-content", [&] {
    require_claimable(repository_.get(entity_id), scope, execution_id);
    return store_content(context_.objects, fmt::format("entities/{}", entity_id),
                         command.content, command.file);
  });

  auto row_version = journal.run(execution_id, "persist-row", [&] {
    auto now = chronicle::common::now_ms();
    auto row = entity_row_t{};
    row.id = entity_id;
    row.user_id = event.event.user_id.value_or("");
    row.workspace_id = event.event.scope.workspace_id;
    row.entity_type = command.entity_type;
    row.title = command.title;
    row.content = content;
    row.tags = command.tags;
    row.properties = command.properties;
    row.audit = row_audit_t{.source_event_id = execution_id,
                            .created_at = now,
                            .updated_at = now};
    auto existing = repository_.get(entity_id);
    require_claimable(existing, scope, execution_id);
    if (existing) {
      row.row_version = existing->row_version;
      row.audit.created_at = existing->audit.created_at;
    }
    repository_.upsert(row);
    return row.row_version;
  });

  journal.run(execution_id, "persist-extension", [&] {
    if (command.entity_type != kTaskEntityType) {
      return;
    }
    repository_.upsert_task(make_task(entity_id,
                                      command.task.value_or(task_fields_t{}),
                                      chronicle::common::now_ms()));
  });

  auto completed = make_completed(
      event, command_completed_t{.resource_id = entity_id,
                                 .resource_version = row_version,
                                 .content = content,
                                 .summary = fmt::format("created {} '{}'",
                                                        command.entity_type,
                                                        command.title)});
  journal.run(execution_id, "emit-completed",
              [&] { emit_completed(context_.publisher, completed); });

  journal.run(execution_id, "notify", [&] {
    notify_best_effort(context_.notifications, completed, "created");
  });
  spdlog::info("Entity {} created by {}", entity_id, execution_id);
}

void entities_worker::update(const stored_event_t& event,
                             const entity_update_t& command) {
  const auto& execution_id = event.event.id;
  auto& journal = context_.journal;
  auto scope = make_tenant_scope(event.event);

  auto load = [&] {
    auto row = repository_.find(command.entity_id, scope);
    if (!row) {
      throw step_failure{error_code::resource_not_found,
                         fmt::format("entity {} not found", command.entity_id)};
    }
    return *row;
  };

  auto content = journal.run(execution_id, "store-content", [&] {
    auto current = load();
    check_expected_version(current, command.expected_version);
    return store_content(
        context_.objects,
        fmt::format("entities/{}/{}", command.entity_id, execution_id),
        command.content, std::nullopt);
  });

  auto row = journal.run(execution_id, "persist-row", [&] {
    auto current = load();
    if (applied_by(current, execution_id)) {
      return current;
    }
    check_expected_version(current, command.expected_version);
    if (command.title) {
      current.title = *command.title;
    }
    if (content) {
      current.content = content;
    }
    if (command.tags) {
      current.tags = *command.tags;
    }
    for (const auto& property : command.properties) {
      auto it = std::ranges::find(current.properties, property.key,
                                  &property_t::key);
      if (it == std::end(current.properties)) {
        current.properties.push_back(property);
      } else {
        it->value = property.value;
      }
    }
    ++current.row_version;
    current.audit.source_event_id = execution_id;
    current.audit.updated_at = chronicle::common::now_ms();
    repository_.upsert(current);
    return current;
  });

  journal.run(execution_id, "persist-extension", [&] {
    if (row.entity_type != kTaskEntityType || !command.task) {
      return;
    }
    auto task = make_task(row.id, *command.task, chronicle::common::now_ms());
    if (auto previous = repository_.task(row.id);
        previous && previous->completed_at && task.status == kDoneStatus) {
      task.completed_at = previous->completed_at;
    }
    repository_.upsert_task(task);
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

void entities_worker::remove(const stored_event_t& event,
                             const entity_delete_t& command) {
  const auto& execution_id = event.event.id;
  auto& journal = context_.journal;
  auto scope = make_tenant_scope(event.event);

  auto row_version = journal.run(execution_id, "persist-row", [&] {
    if (auto previous = repository_.get(command.entity_id);
        previous && previous->audit.deleted_at &&
        applied_by(*previous, execution_id)) {
      return previous->row_version;
    }
    auto row = repository_.find(command.entity_id, scope);
    if (!row) {
      throw step_failure{error_code::resource_not_found,
                         fmt::format("entity {} not found", command.entity_id)};
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
      event, command_completed_t{.resource_id = command.entity_id,
                                 .resource_version = row_version,
                                 .summary = fmt::format("deleted {}",
                                                        command.entity_id)});
  journal.run(execution_id, "emit-completed",
              [&] { emit_completed(context_.publisher, completed); });
  journal.run(execution_id, "notify", [&] {
    notify_best_effort(context_.notifications, completed, "deleted");
  });
}

}  // namespace chronicle::workers
