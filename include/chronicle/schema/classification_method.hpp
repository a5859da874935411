#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace chronicle::schema {

enum class classification_method_t : uint8_t {
  embedding_similarity = 0,
  llm_analysis = 1,
  rule_based = 2
};

inline constexpr auto kClassificationMethodMappings = std::array{
    enum_mapping_t<classification_method_t>{"embedding_similarity", classification_method_t::embedding_similarity},
    enum_mapping_t<classification_method_t>{"llm_analysis", classification_method_t::llm_analysis},
    enum_mapping_t<classification_method_t>{"rule_based", classification_method_t::rule_based},
};

template <>
inline std::optional<classification_method_t> try_from_string<classification_method_t>(
    const std::string_view value) {
  return from_string(value, kClassificationMethodMappings);
}

inline constexpr std::string_view to_string(const classification_method_t value) {
  return to_string(value, kClassificationMethodMappings).value_or("unknown");
}

}  // namespace chronicle::schema
