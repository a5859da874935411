#pragma once

#include <chronicle/schema/object_ref.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/task_fields.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: entities.create payload.
// Note, task, idea or any other knowledge item. `entity_id` may be supplied
// by the caller; otherwise the worker derives one from the event id.
namespace chronicle::schema {

template <uint16_t Version>
struct entity_create;

template <>
struct entity_create<1> final {
  uint16_t version{1};
  std::optional<id_t> entity_id;
  std::string entity_type;
  std::string title;
  std::optional<std::string> content;
  std::optional<file_upload_t> file;
  std::vector<std::string> tags;
  std::vector<property_t> properties;
  std::optional<task_fields_t> task;
};

using entity_create_t = entity_create<1>;

}  // namespace chronicle::schema
