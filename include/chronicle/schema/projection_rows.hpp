#pragma once

#include <chronicle/schema/ai_provenance.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/relationship_type.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Derived read tables. Every row can be regenerated from the event log and
// is keyed by the event that produced it.
namespace chronicle::schema {

template <uint16_t Version>
struct enrichment_row;

/// One extraction, classification or inferred-properties record.
template <>
struct enrichment_row<1> final {
  uint16_t version{1};
  id_t entity_id;
  id_t source_event_id;
  std::string kind;
  std::string agent;
  std::optional<basis_points_t> confidence;
  std::string summary;
  std::vector<property_t> properties;
  timestamp_milliseconds_t created_at{};
};

using enrichment_row_t = enrichment_row<1>;

template <uint16_t Version>
struct relationship_row;

template <>
struct relationship_row<1> final {
  uint16_t version{1};
  id_t source_entity_id;
  id_t target_entity_id;
  relationship_type_t type{relationship_type_t::related_to};
  basis_points_t confidence{};
  std::string agent;
  id_t source_event_id;
  bool reverse{};
  timestamp_milliseconds_t created_at{};
};

using relationship_row_t = relationship_row<1>;

template <uint16_t Version>
struct reasoning_row;

template <>
struct reasoning_row<1> final {
  uint16_t version{1};
  id_t subject_id;
  id_t source_event_id;
  std::string agent;
  std::vector<reasoning_step_t> steps;
  std::optional<reasoning_outcome_t> outcome;
  std::optional<duration_milliseconds_t> duration_ms;
  std::optional<uint64_t> token_count;
  timestamp_milliseconds_t created_at{};
};

using reasoning_row_t = reasoning_row<1>;

}  // namespace chronicle::schema
