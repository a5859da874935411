#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Originator class of an event. Only `intelligence` is gated on aiAutoApprove.
namespace chronicle::schema {

enum class source_t : uint8_t {
  user = 0,
  automation = 1,
  sync = 2,
  migration = 3,
  system = 4,
  intelligence = 5
};

inline constexpr auto kSourceMappings = std::array{
    enum_mapping_t<source_t>{"user", source_t::user},
    enum_mapping_t<source_t>{"automation", source_t::automation},
    enum_mapping_t<source_t>{"sync", source_t::sync},
    enum_mapping_t<source_t>{"migration", source_t::migration},
    enum_mapping_t<source_t>{"system", source_t::system},
    enum_mapping_t<source_t>{"intelligence", source_t::intelligence},
};

template <>
inline std::optional<source_t> try_from_string<source_t>(
    const std::string_view value) {
  return from_string(value, kSourceMappings);
}

inline constexpr std::string_view to_string(const source_t value) {
  return to_string(value, kSourceMappings).value_or("unknown");
}

}  // namespace chronicle::schema
