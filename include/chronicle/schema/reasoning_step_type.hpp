#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace chronicle::schema {

enum class reasoning_step_type_t : uint8_t {
  thinking = 0,
  tool_call = 1,
  tool_result = 2,
  decision = 3,
  observation = 4
};

inline constexpr auto kReasoningStepTypeMappings = std::array{
    enum_mapping_t<reasoning_step_type_t>{"thinking", reasoning_step_type_t::thinking},
    enum_mapping_t<reasoning_step_type_t>{"tool_call", reasoning_step_type_t::tool_call},
    enum_mapping_t<reasoning_step_type_t>{"tool_result", reasoning_step_type_t::tool_result},
    enum_mapping_t<reasoning_step_type_t>{"decision", reasoning_step_type_t::decision},
    enum_mapping_t<reasoning_step_type_t>{"observation", reasoning_step_type_t::observation},
};

template <>
inline std::optional<reasoning_step_type_t> try_from_string<reasoning_step_type_t>(
    const std::string_view value) {
  return from_string(value, kReasoningStepTypeMappings);
}

inline constexpr std::string_view to_string(const reasoning_step_type_t value) {
  return to_string(value, kReasoningStepTypeMappings).value_or("unknown");
}

}  // namespace chronicle::schema
