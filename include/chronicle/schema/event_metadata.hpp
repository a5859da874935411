#pragma once

#include <chronicle/schema/ai_provenance.hpp>
#include <chronicle/schema/permission_decision.hpp>
#include <chronicle/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::schema {

/// Context for content imported from an external tool.
struct import_context_t final {
  std::string origin;
  std::optional<std::string> external_id;
  std::optional<std::string> external_url;
  timestamp_milliseconds_t imported_at{};
  std::optional<id_t> batch_id;
};

/// Context for events replayed from another device.
struct sync_context_t final {
  std::string device_id;
  std::string platform;
  timestamp_milliseconds_t synced_at{};
  bool offline{};
};

/// Context for events fired by an automation rule.
struct automation_context_t final {
  id_t rule_id;
  std::string rule_name;
  std::string trigger_type;
  std::optional<std::string> trigger_event;
  std::optional<id_t> execution_id;
};

template <uint16_t Version>
struct event_metadata;

/// Provenance of an event. Everything here is optional; `approval` and
/// `annotations` are the only parts that may grow after the event is
/// appended.
template <>
struct event_metadata<1> final {
  uint16_t version{1};
  std::optional<ai_provenance_t> ai;
  std::optional<import_context_t> import_context;
  std::optional<sync_context_t> sync;
  std::optional<automation_context_t> automation;
  std::optional<permission_decision_t> approval;
  std::vector<property_t> annotations;
  std::vector<property_t> custom;
};

using event_metadata_t = event_metadata<1>;

}  // namespace chronicle::schema
