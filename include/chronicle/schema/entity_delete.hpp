#pragma once

#include <chronicle/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace chronicle::schema {

template <uint16_t Version>
struct entity_delete;

template <>
struct entity_delete<1> final {
  uint16_t version{1};
  id_t entity_id;
  std::optional<uint64_t> expected_version;
};

using entity_delete_t = entity_delete<1>;

}  // namespace chronicle::schema
