#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace chronicle::schema {

enum class thread_status_t : uint8_t {
  active = 0,
  merged = 1,
  archived = 2
};

inline constexpr auto kThreadStatusMappings = std::array{
    enum_mapping_t<thread_status_t>{"active", thread_status_t::active},
    enum_mapping_t<thread_status_t>{"merged", thread_status_t::merged},
    enum_mapping_t<thread_status_t>{"archived", thread_status_t::archived},
};

template <>
inline std::optional<thread_status_t> try_from_string<thread_status_t>(
    const std::string_view value) {
  return from_string(value, kThreadStatusMappings);
}

inline constexpr std::string_view to_string(const thread_status_t value) {
  return to_string(value, kThreadStatusMappings).value_or("unknown");
}

}  // namespace chronicle::schema
