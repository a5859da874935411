#pragma once

#include <chronicle/schema/event_metadata.hpp>
#include <chronicle/schema/payload.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/source.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace chronicle::schema {

/// Tenant context. A command without a workspace concerns a personal
/// resource.
struct event_scope_t final {
  std::optional<id_t> workspace_id;
  std::optional<id_t> project_id;
};

/// Causality links. Cross-subject ordering is expressed only through these.
struct event_trace_t final {
  std::optional<id_t> correlation_id;
  std::optional<id_t> causation_id;
  std::optional<id_t> request_id;
};

template <uint16_t Version>
struct event;

/// Immutable envelope of every command and phase transition. Once appended
/// only `metadata` may change, and only by addition.
template <>
struct event<1> final {
  uint16_t version{1};
  id_t id;
  std::string type;
  std::optional<id_t> subject_id;
  std::optional<std::string> subject_type;
  std::optional<user_id_t> user_id;
  source_t source{source_t::user};
  timestamp_milliseconds_t timestamp{};
  event_scope_t scope;
  event_trace_t trace;
  payload_t data;
  event_metadata_t metadata;
};

using event_t = event<1>;

template <uint16_t Version>
struct stored_event;

/// An appended event with its position in the global log (`sequence`) and
/// in its subject's stream (`aggregate_version`, 1-based; 0 when the event
/// has no subject).
template <>
struct stored_event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  uint64_t aggregate_version{};
  event_t event;
};

using stored_event_t = stored_event<1>;

}  // namespace chronicle::schema
