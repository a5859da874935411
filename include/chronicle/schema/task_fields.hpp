#pragma once

#include <chronicle/schema/primitives.hpp>

#include <optional>
#include <string>

namespace chronicle::schema {

/// Task specific columns; only meaningful when entity_type is "task".
struct task_fields_t final {
  std::string status{"todo"};
  std::optional<std::string> priority;
  std::optional<timestamp_milliseconds_t> due_at;
};

inline constexpr auto kTaskEntityType = std::string_view{"task"};

}  // namespace chronicle::schema
