#pragma once

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <string_view>

// Wire names of schema enums. Every enum header declares a k*Mappings table
// and specializes try_from_string/to_string over it; event types, logs and
// denial reasons all use these names.
namespace chronicle::schema {

template <typename Enum>
struct enum_mapping_t final {
  std::string_view name;
  Enum value;
};

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view name,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  auto it = std::ranges::find(mappings, name, &enum_mapping_t<Enum>::name);
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->value;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  auto it = std::ranges::find(mappings, value, &enum_mapping_t<Enum>::value);
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->name;
}

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view) {
  return std::nullopt;
}

}  // namespace chronicle::schema
