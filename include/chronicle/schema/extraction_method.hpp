#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace chronicle::schema {

enum class extraction_method_t : uint8_t {
  explicit_request = 0,
  implicit = 1,
  relationship = 2
};

inline constexpr auto kExtractionMethodMappings = std::array{
    enum_mapping_t<extraction_method_t>{"explicit", extraction_method_t::explicit_request},
    enum_mapping_t<extraction_method_t>{"implicit", extraction_method_t::implicit},
    enum_mapping_t<extraction_method_t>{"relationship", extraction_method_t::relationship},
};

template <>
inline std::optional<extraction_method_t> try_from_string<extraction_method_t>(
    const std::string_view value) {
  return from_string(value, kExtractionMethodMappings);
}

inline constexpr std::string_view to_string(const extraction_method_t value) {
  return to_string(value, kExtractionMethodMappings).value_or("unknown");
}

}  // namespace chronicle::schema
