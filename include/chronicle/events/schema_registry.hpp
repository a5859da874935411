#pragma once

#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/event.hpp>
#include <chronicle/schema/event_type.hpp>
#include <chronicle/schema/payload.hpp>
#include <chronicle/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::events {

struct validation_result final {
  uint32_t code{};
  std::string log;
  std::optional<chronicle::schema::payload_t> payload;
  /// False when the type has no registered schema and the payload passed
  /// through as unvalidated.
  bool validated{};
};

/// Caller-supplied parts of a new event; id and timestamp are assigned by
/// create_event().
struct event_input_t final {
  std::string type;
  std::optional<chronicle::schema::id_t> subject_id;
  std::optional<std::string> subject_type;
  std::optional<chronicle::schema::user_id_t> user_id;
  chronicle::schema::source_t source{chronicle::schema::source_t::user};
  chronicle::schema::event_scope_t scope;
  chronicle::schema::event_trace_t trace;
  chronicle::schema::payload_t data;
  chronicle::schema::event_metadata_t metadata;
};

struct creation_result final {
  uint32_t code{};
  std::string log;
  std::optional<chronicle::schema::event_t> event;
};

/// Maps every event type to exactly one payload schema plus optional
/// structural checks. Built once at startup and injected wherever envelopes
/// are validated.
class schema_registry final {
 public:
  /// Returns an error message, or std::nullopt when the payload is valid.
  template <typename Payload>
  using check_t = std::function<std::optional<std::string>(const Payload&)>;

  template <typename Payload>
  bool register_type(const std::string_view type,
                     check_t<Payload> check = {});

  /// Registers the requested, validated, pending and denied types of
  /// `{subject}.{action}` with one schema.
  template <typename Payload>
  bool register_command(const std::string_view subject,
                        const std::string_view action,
                        check_t<Payload> check = {});

  bool contains(const std::string_view type) const;

  /// Decode raw SCALE bytes against the schema of `type`.
  validation_result validate(const std::string_view type,
                             const chronicle::schema::bytes_view_t& raw) const;

  /// Validate an already typed payload. An unvalidated payload for a
  /// registered type is decoded through validate().
  validation_result check(const std::string_view type,
                          const chronicle::schema::payload_t& payload) const;

  /// Build a fresh envelope. `input` is copied, never modified.
  creation_result create_event(const event_input_t& input) const;

  std::vector<std::string> registered_types() const;

 private:
  struct entry final {
    std::size_t alternative{};
    std::string schema_name;
    std::function<std::optional<chronicle::schema::payload_t>(
        const chronicle::schema::bytes_view_t&)>
        decode;
    std::function<std::optional<std::string>(
        const chronicle::schema::payload_t&)>
        check;
  };

  bool insert(const std::string_view type, entry value);
  validation_result run_checks(const entry& schema,
                               const std::string_view type,
                               chronicle::schema::payload_t payload) const;

  std::map<std::string, entry, std::less<>> entries_;
};

template <typename Payload>
bool schema_registry::register_type(const std::string_view type,
                                    check_t<Payload> check) {
  auto value = entry{};
  value.alternative =
      chronicle::schema::payload_t{std::in_place_type<Payload>}.index();
  value.schema_name = std::string{chronicle::schema::payload_name(
      chronicle::schema::payload_t{std::in_place_type<Payload>})};
  value.decode = [](const chronicle::schema::bytes_view_t& raw)
      -> std::optional<chronicle::schema::payload_t> {
    auto encoder = chronicle::schema::encoding::scale_encoder_t{};
    auto decoded = encoder.try_decode<Payload>(raw);
    if (!decoded) {
      return std::nullopt;
    }
    return chronicle::schema::payload_t{std::move(*decoded)};
  };
  value.check = [check = std::move(check)](
                    const chronicle::schema::payload_t& payload)
      -> std::optional<std::string> {
    if (!check) {
      return std::nullopt;
    }
    return check(std::get<Payload>(payload));
  };
  return insert(type, std::move(value));
}

template <typename Payload>
bool schema_registry::register_command(const std::string_view subject,
                                       const std::string_view action,
                                       check_t<Payload> check) {
  using enum chronicle::schema::phase_t;
  auto registered = true;
  for (auto phase : {requested, validated, pending, denied}) {
    registered &= register_type<Payload>(
        chronicle::schema::make_event_type(subject, action, phase), check);
  }
  return registered;
}

/// Built-in subjects: entities, documents, workspaces, workspace_members
/// and project_members, including their completed types.
void register_default_schemas(schema_registry& registry);

}  // namespace chronicle::events
