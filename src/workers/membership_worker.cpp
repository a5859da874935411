#include <chronicle/common/ids.hpp>
#include <chronicle/execution/step_failure.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/workers/membership_worker.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace chronicle::workers {

using namespace chronicle::schema;
using chronicle::execution::step_failure;

namespace {

id_t membership_id(const context_type_t context_type,
                   const std::string_view context_id,
                   const std::string_view user_id) {
  return chronicle::common::make_deterministic_uuid(
      "membership",
      fmt::format("{}:{}:{}{}", to_string(context_type), context_id.size(),
                  context_id, user_id));
}

/// Membership commands act on the context the governor checked.
void require_context(const event_t& event,
                     const context_type_t context_type,
                     const id_t& context_id) {
  const auto& scoped = context_type == context_type_t::workspace
                           ? event.scope.workspace_id
                           : event.scope.project_id;
  if (!scoped || *scoped != context_id) {
    throw step_failure{
        error_code::scope_violation,
        fmt::format("{} {} is outside the command scope",
                    to_string(context_type), context_id)};
  }
}

}  // namespace

membership_worker::membership_worker(
    worker_context context,
    chronicle::governor::membership_directory& directory)
    : context_{context}, directory_{directory} {}

chronicle::dispatch::handler_result membership_worker::handle(
    const stored_event_t& event) {
  return run_worker(context_, kName, event, [&](const event_type_t& type) {
    std::visit(
        overloaded{
            [&](const workspace_create_t& command) {
              create_workspace(event, command);
            },
            [&](const workspace_update_t& command) {
              update_workspace(event, command);
            },
            [&](const member_upsert_t& command) {
              upsert_member(event, command);
            },
            [&](const member_remove_t& command) {
              remove_member(event, command);
            },
            [&](const auto& other) {
              throw step_failure{
                  error_code::payload_mismatch,
                  fmt::format("{} carries {}", to_string(type),
                              payload_name(payload_t{other}))};
            }},
        event.event.data);
  });
}

void membership_worker::create_workspace(const stored_event_t& event,
                                         const workspace_create_t& command) {
  const auto& execution_id = event.event.id;
  auto workspace_id = command.workspace_id.value_or(
      chronicle::common::make_deterministic_uuid("workspaces", execution_id));
  auto owner_id = event.event.user_id.value_or("");

  context_.journal.run(execution_id, "persist-row", [&] {
    auto now = chronicle::common::now_ms();
    auto settings = workspace_settings_t{};
    settings.workspace_id = workspace_id;
    settings.name = command.name;
    settings.owner_id = owner_id;
    settings.ai_auto_approve = command.ai_auto_approve;
    settings.created_at = now;
    if (auto existing = directory_.settings(workspace_id)) {
      if (existing->owner_id != owner_id) {
        throw step_failure{
            error_code::scope_violation,
            fmt::format("workspace {} already exists", workspace_id)};
      }
      settings.created_at = existing->created_at;
    }
    directory_.save_settings(settings);
  });

  context_.journal.run(execution_id, "persist-extension", [&] {
    directory_.upsert(membership_t{.context_type = context_type_t::workspace,
                                   .context_id = workspace_id,
                                   .user_id = owner_id,
                                   .role = role_t::owner,
                                   .granted_at = chronicle::common::now_ms()});
  });

  finish(event, command_completed_t{
                    .resource_id = workspace_id,
                    .resource_version = 1,
                    .summary = fmt::format("created workspace '{}'",
                                           command.name)});
}

void membership_worker::update_workspace(const stored_event_t& event,
                                         const workspace_update_t& command) {
  const auto& execution_id = event.event.id;
  require_context(event.event, context_type_t::workspace,
                  command.workspace_id);

  context_.journal.run(execution_id, "persist-row", [&] {
    auto settings = directory_.settings(command.workspace_id);
    if (!settings) {
      throw step_failure{
          error_code::resource_not_found,
          fmt::format("workspace {} not found", command.workspace_id)};
    }
    if (command.name) {
      settings->name = *command.name;
    }
    if (command.ai_auto_approve) {
      settings->ai_auto_approve = *command.ai_auto_approve;
    }
    directory_.save_settings(*settings);
  });

  finish(event, command_completed_t{
                    .resource_id = command.workspace_id,
                    .resource_version = event.aggregate_version,
                    .summary = fmt::format("updated workspace {}",
                                           command.workspace_id)});
}

void membership_worker::upsert_member(const stored_event_t& event,
                                      const member_upsert_t& command) {
  const auto& execution_id = event.event.id;
  require_context(event.event, command.context_type, command.context_id);

  context_.journal.run(execution_id, "persist-row", [&] {
    auto granted_at = chronicle::common::now_ms();
    if (auto existing = directory_.find(command.context_type,
                                        command.context_id, command.member_id)) {
      granted_at = existing->granted_at;
    }
    directory_.upsert(membership_t{.context_type = command.context_type,
                                   .context_id = command.context_id,
                                   .user_id = command.member_id,
                                   .role = command.role,
                                   .granted_at = granted_at});
  });

  finish(event, command_completed_t{
                    .resource_id = membership_id(command.context_type,
                                                 command.context_id,
                                                 command.member_id),
                    .resource_version = event.aggregate_version,
                    .summary = fmt::format("{} is {} of {} {}",
                                           command.member_id,
                                           to_string(command.role),
                                           to_string(command.context_type),
                                           command.context_id)});
}

void membership_worker::remove_member(const stored_event_t& event,
                                      const member_remove_t& command) {
  const auto& execution_id = event.event.id;
  require_context(event.event, command.context_type, command.context_id);

  context_.journal.run(execution_id, "persist-row", [&] {
    if (!directory_.remove(command.context_type, command.context_id,
                           command.member_id)) {
      spdlog::debug("{} had no membership in {} {}", command.member_id,
                    to_string(command.context_type), command.context_id);
    }
  });

  finish(event, command_completed_t{
                    .resource_id = membership_id(command.context_type,
                                                 command.context_id,
                                                 command.member_id),
                    .resource_version = event.aggregate_version,
                    .summary = fmt::format("removed {} from {} {}",
                                           command.member_id,
                                           to_string(command.context_type),
                                           command.context_id)});
}

void membership_worker::finish(const stored_event_t& event,
                               command_completed_t result) {
  const auto& execution_id = event.event.id;
  auto completed = make_completed(event, std::move(result));
  context_.journal.run(execution_id, "emit-completed",
                       [&] { emit_completed(context_.publisher, completed); });
  context_.journal.run(execution_id, "notify", [&] {
    notify_best_effort(context_.notifications, completed,
                       completed.type);
  });
}

}  // namespace chronicle::workers
