#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace chronicle::schema {

enum class message_role_t : uint8_t {
  user = 0,
  assistant = 1,
  system = 2
};

inline constexpr auto kMessageRoleMappings = std::array{
    enum_mapping_t<message_role_t>{"user", message_role_t::user},
    enum_mapping_t<message_role_t>{"assistant", message_role_t::assistant},
    enum_mapping_t<message_role_t>{"system", message_role_t::system},
};

template <>
inline std::optional<message_role_t> try_from_string<message_role_t>(
    const std::string_view value) {
  return from_string(value, kMessageRoleMappings);
}

inline constexpr std::string_view to_string(const message_role_t value) {
  return to_string(value, kMessageRoleMappings).value_or("unknown");
}

}  // namespace chronicle::schema
