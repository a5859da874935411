#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace chronicle::schema {

enum class context_type_t : uint8_t {
  workspace = 0,
  project = 1
};

inline constexpr auto kContextTypeMappings = std::array{
    enum_mapping_t<context_type_t>{"workspace", context_type_t::workspace},
    enum_mapping_t<context_type_t>{"project", context_type_t::project},
};

template <>
inline std::optional<context_type_t> try_from_string<context_type_t>(
    const std::string_view value) {
  return from_string(value, kContextTypeMappings);
}

inline constexpr std::string_view to_string(const context_type_t value) {
  return to_string(value, kContextTypeMappings).value_or("unknown");
}

}  // namespace chronicle::schema
