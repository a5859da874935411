#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace chronicle::schema {

enum class relationship_type_t : uint8_t {
  related_to = 0,
  part_of = 1,
  depends_on = 2,
  mentioned_in = 3,
  created_from = 4,
  supersedes = 5,
  similar_to = 6,
  contradicts = 7
};

inline constexpr auto kRelationshipTypeMappings = std::array{
    enum_mapping_t<relationship_type_t>{"related_to", relationship_type_t::related_to},
    enum_mapping_t<relationship_type_t>{"part_of", relationship_type_t::part_of},
    enum_mapping_t<relationship_type_t>{"depends_on", relationship_type_t::depends_on},
    enum_mapping_t<relationship_type_t>{"mentioned_in", relationship_type_t::mentioned_in},
    enum_mapping_t<relationship_type_t>{"created_from", relationship_type_t::created_from},
    enum_mapping_t<relationship_type_t>{"supersedes", relationship_type_t::supersedes},
    enum_mapping_t<relationship_type_t>{"similar_to", relationship_type_t::similar_to},
    enum_mapping_t<relationship_type_t>{"contradicts", relationship_type_t::contradicts},
};

template <>
inline std::optional<relationship_type_t> try_from_string<relationship_type_t>(
    const std::string_view value) {
  return from_string(value, kRelationshipTypeMappings);
}

inline constexpr std::string_view to_string(const relationship_type_t value) {
  return to_string(value, kRelationshipTypeMappings).value_or("unknown");
}

}  // namespace chronicle::schema
