#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace chronicle::schema {

enum class permission_t : uint8_t {
  read = 0,
  write = 1,
  remove = 2,
  manage = 3,
  invite = 4
};

inline constexpr auto kPermissionMappings = std::array{
    enum_mapping_t<permission_t>{"read", permission_t::read},
    enum_mapping_t<permission_t>{"write", permission_t::write},
    enum_mapping_t<permission_t>{"delete", permission_t::remove},
    enum_mapping_t<permission_t>{"manage", permission_t::manage},
    enum_mapping_t<permission_t>{"invite", permission_t::invite},
};

template <>
inline std::optional<permission_t> try_from_string<permission_t>(
    const std::string_view value) {
  return from_string(value, kPermissionMappings);
}

inline constexpr std::string_view to_string(const permission_t value) {
  return to_string(value, kPermissionMappings).value_or("unknown");
}

}  // namespace chronicle::schema
