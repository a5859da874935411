#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Lifecycle position of a command; always the last segment of an event type.
namespace chronicle::schema {

enum class phase_t : uint8_t {
  requested = 0,
  validated = 1,
  pending = 2,
  denied = 3,
  completed = 4
};

inline constexpr auto kPhaseMappings = std::array{
    enum_mapping_t<phase_t>{"requested", phase_t::requested},
    enum_mapping_t<phase_t>{"validated", phase_t::validated},
    enum_mapping_t<phase_t>{"pending", phase_t::pending},
    enum_mapping_t<phase_t>{"denied", phase_t::denied},
    enum_mapping_t<phase_t>{"completed", phase_t::completed},
};

template <>
inline std::optional<phase_t> try_from_string<phase_t>(
    const std::string_view value) {
  return from_string(value, kPhaseMappings);
}

inline constexpr std::string_view to_string(const phase_t value) {
  return to_string(value, kPhaseMappings).value_or("unknown");
}

}  // namespace chronicle::schema
