#pragma once

#include <chronicle/schema/object_ref.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/row_audit.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::schema {

template <uint16_t Version>
struct entity_row;

template <>
struct entity_row<1> final {
  uint16_t version{1};
  id_t id;
  user_id_t user_id;
  std::optional<id_t> workspace_id;
  std::string entity_type;
  std::string title;
  std::optional<object_ref_t> content;
  std::vector<std::string> tags;
  std::vector<property_t> properties;
  uint64_t row_version{1};
  row_audit_t audit;
};

using entity_row_t = entity_row<1>;

template <uint16_t Version>
struct task_row;

/// Extension row for entities of type "task".
template <>
struct task_row<1> final {
  uint16_t version{1};
  id_t entity_id;
  std::string status;
  std::optional<std::string> priority;
  std::optional<timestamp_milliseconds_t> due_at;
  std::optional<timestamp_milliseconds_t> completed_at;
};

using task_row_t = task_row<1>;

}  // namespace chronicle::schema
