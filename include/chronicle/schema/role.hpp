#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Membership role, ordered from least to most privileged.
namespace chronicle::schema {

enum class role_t : uint8_t {
  viewer = 0,
  editor = 1,
  admin = 2,
  owner = 3
};

inline constexpr auto kRoleMappings = std::array{
    enum_mapping_t<role_t>{"viewer", role_t::viewer},
    enum_mapping_t<role_t>{"editor", role_t::editor},
    enum_mapping_t<role_t>{"admin", role_t::admin},
    enum_mapping_t<role_t>{"owner", role_t::owner},
};

template <>
inline std::optional<role_t> try_from_string<role_t>(
    const std::string_view value) {
  return from_string(value, kRoleMappings);
}

inline constexpr std::string_view to_string(const role_t value) {
  return to_string(value, kRoleMappings).value_or("unknown");
}

}  // namespace chronicle::schema
