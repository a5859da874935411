#include <chronicle/common/ids.hpp>
#include <chronicle/events/schema_registry.hpp>
#include <chronicle/schema/error_code.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>

namespace chronicle::events {

using namespace chronicle::schema;

namespace {

validation_result make_error(const error_code code, std::string log) {
  return validation_result{.code = to_code(code), .log = std::move(log)};
}

std::optional<std::string> require(const bool condition,
                                   const std::string_view message) {
  if (condition) {
    return std::nullopt;
  }
  return std::string{message};
}

}  // namespace

bool schema_registry::insert(const std::string_view type, entry value) {
  if (!parse_event_type(type)) {
    spdlog::error("Refusing to register malformed event type '{}'", type);
    return false;
  }
  auto [it, inserted] = entries_.emplace(std::string{type}, std::move(value));
  if (!inserted) {
    spdlog::error("Event type '{}' already has a registered schema", type);
  }
  return inserted;
}

bool schema_registry::contains(const std::string_view type) const {
  return entries_.find(type) != std::end(entries_);
}

std::vector<std::string> schema_registry::registered_types() const {
  auto types = std::vector<std::string>{};
  types.reserve(entries_.size());
  for (const auto& [type, value] : entries_) {
    types.push_back(type);
  }
  return types;
}

validation_result schema_registry::run_checks(const entry& schema,
                                              const std::string_view type,
                                              payload_t payload) const {
  if (payload.index() != schema.alternative) {
    return make_error(error_code::payload_mismatch,
                      fmt::format("{} expects a {} payload, got {}", type,
                                  schema.schema_name, payload_name(payload)));
  }
  if (auto problem = schema.check(payload)) {
    return make_error(error_code::schema_validation_failed,
                      fmt::format("{}: {}", type, *problem));
  }
  return validation_result{
      .payload = std::move(payload), .validated = true};
}

validation_result schema_registry::validate(const std::string_view type,
                                            const bytes_view_t& raw) const {
  if (!parse_event_type(type)) {
    return make_error(error_code::malformed_event_type,
                      fmt::format("malformed event type '{}'", type));
  }
  auto it = entries_.find(type);
  if (it == std::end(entries_)) {
    spdlog::warn("No schema registered for '{}'; accepting as unvalidated",
                 type);
    return validation_result{
        .payload = payload_t{unvalidated_payload_t{.raw = make_bytes(raw)}},
        .validated = false};
  }
  auto decoded = it->second.decode(raw);
  if (!decoded) {
    return make_error(error_code::schema_validation_failed,
                      fmt::format("{}: payload does not decode as {}", type,
                                  it->second.schema_name));
  }
  return run_checks(it->second, type, std::move(*decoded));
}

validation_result schema_registry::check(const std::string_view type,
                                         const payload_t& payload) const {
  if (const auto* raw = std::get_if<unvalidated_payload_t>(&payload)) {
    return validate(type, make_bytes_view(raw->raw));
  }
  if (!parse_event_type(type)) {
    return make_error(error_code::malformed_event_type,
                      fmt::format("malformed event type '{}'", type));
  }
  auto it = entries_.find(type);
  if (it == std::end(entries_)) {
    return make_error(
        error_code::payload_mismatch,
        fmt::format("typed {} payload for unregistered type '{}'",
                    payload_name(payload), type));
  }
  return run_checks(it->second, type, payload);
}

creation_result schema_registry::create_event(
    const event_input_t& input) const {
  auto checked = check(input.type, input.data);
  if (checked.code != 0) {
    return creation_result{.code = checked.code, .log = checked.log};
  }
  auto event = event_t{};
  event.id = chronicle::common::make_uuid();
  event.type = input.type;
  event.subject_id = input.subject_id;
  event.subject_type = input.subject_type;
  event.user_id = input.user_id;
  event.source = input.source;
  event.timestamp = chronicle::common::now_ms();
  event.scope = input.scope;
  event.trace = input.trace;
  event.data = std::move(*checked.payload);
  event.metadata = input.metadata;
  return creation_result{.event = std::move(event)};
}

void register_default_schemas(schema_registry& registry) {
  registry.register_command<entity_create_t>(
      "entities", "create",
      [](const entity_create_t& payload) -> std::optional<std::string> {
        if (payload.entity_type.empty()) {
          return "entity_type is required";
        }
        if (payload.task && payload.entity_type != kTaskEntityType) {
          return "task fields require entity_type 'task'";
        }
        if (payload.entity_id && payload.entity_id->empty()) {
          return "entity_id must not be empty when supplied";
        }
        return std::nullopt;
      });
  registry.register_command<entity_update_t>(
      "entities", "update", [](const entity_update_t& payload) {
        return require(!payload.entity_id.empty(), "entity_id is required");
      });
  registry.register_command<entity_delete_t>(
      "entities", "delete", [](const entity_delete_t& payload) {
        return require(!payload.entity_id.empty(), "entity_id is required");
      });

  registry.register_command<document_create_t>(
      "documents", "create",
      [](const document_create_t& payload) -> std::optional<std::string> {
        if (payload.title.empty()) {
          return "title is required";
        }
        if (payload.content_type.empty()) {
          return "content_type is required";
        }
        return std::nullopt;
      });
  registry.register_command<document_update_t>(
      "documents", "update", [](const document_update_t& payload) {
        return require(!payload.document_id.empty(), "document_id is required");
      });
  registry.register_command<document_delete_t>(
      "documents", "delete", [](const document_delete_t& payload) {
        return require(!payload.document_id.empty(), "document_id is required");
      });

  registry.register_command<workspace_create_t>(
      "workspaces", "create", [](const workspace_create_t& payload) {
        return require(!payload.name.empty(), "name is required");
      });
  registry.register_command<workspace_update_t>(
      "workspaces", "update", [](const workspace_update_t& payload) {
        return require(!payload.workspace_id.empty(),
                       "workspace_id is required");
      });

  auto member_subjects = std::array{
      std::pair{std::string_view{"workspace_members"},
                context_type_t::workspace},
      std::pair{std::string_view{"project_members"}, context_type_t::project},
  };
  for (const auto& [subject, context] : member_subjects) {
    auto upsert_check =
        [context](const member_upsert_t& payload) -> std::optional<std::string> {
      if (payload.context_type != context) {
        return "context_type does not match subject";
      }
      if (payload.context_id.empty() || payload.member_id.empty()) {
        return "context_id and member_id are required";
      }
      return std::nullopt;
    };
    registry.register_command<member_upsert_t>(subject, "create", upsert_check);
    registry.register_command<member_upsert_t>(subject, "update", upsert_check);
    registry.register_command<member_remove_t>(
        subject, "delete",
        [context](const member_remove_t& payload) -> std::optional<std::string> {
          if (payload.context_type != context) {
            return "context_type does not match subject";
          }
          if (payload.context_id.empty() || payload.member_id.empty()) {
            return "context_id and member_id are required";
          }
          return std::nullopt;
        });
  }

  auto completed = std::array{
      std::pair{"entities", "create"},   std::pair{"entities", "update"},
      std::pair{"entities", "delete"},   std::pair{"documents", "create"},
      std::pair{"documents", "update"},  std::pair{"documents", "delete"},
      std::pair{"workspaces", "create"}, std::pair{"workspaces", "update"},
      std::pair{"workspace_members", "create"},
      std::pair{"workspace_members", "update"},
      std::pair{"workspace_members", "delete"},
      std::pair{"project_members", "create"},
      std::pair{"project_members", "update"},
      std::pair{"project_members", "delete"},
  };
  for (const auto& [subject, action] : completed) {
    registry.register_type<command_completed_t>(
        make_event_type(subject, action, phase_t::completed));
  }
}

}  // namespace chronicle::events
