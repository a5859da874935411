#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace chronicle::schema {

enum class action_t : uint8_t {
  create = 0,
  update = 1,
  remove = 2,
  read = 3,
  list = 4
};

inline constexpr auto kActionMappings = std::array{
    enum_mapping_t<action_t>{"create", action_t::create},
    enum_mapping_t<action_t>{"update", action_t::update},
    enum_mapping_t<action_t>{"delete", action_t::remove},
    enum_mapping_t<action_t>{"read", action_t::read},
    enum_mapping_t<action_t>{"list", action_t::list},
};

template <>
inline std::optional<action_t> try_from_string<action_t>(
    const std::string_view value) {
  return from_string(value, kActionMappings);
}

inline constexpr std::string_view to_string(const action_t value) {
  return to_string(value, kActionMappings).value_or("unknown");
}

}  // namespace chronicle::schema
