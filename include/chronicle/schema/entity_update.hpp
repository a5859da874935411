#pragma once

#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/task_fields.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::schema {

template <uint16_t Version>
struct entity_update;

template <>
struct entity_update<1> final {
  uint16_t version{1};
  id_t entity_id;
  std::optional<uint64_t> expected_version;
  std::optional<std::string> title;
  std::optional<std::string> content;
  std::optional<std::vector<std::string>> tags;
  std::vector<property_t> properties;
  std::optional<task_fields_t> task;
};

using entity_update_t = entity_update<1>;

}  // namespace chronicle::schema
