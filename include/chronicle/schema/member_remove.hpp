#pragma once

#include <chronicle/schema/context_type.hpp>
#include <chronicle/schema/primitives.hpp>

#include <cstdint>

namespace chronicle::schema {

template <uint16_t Version>
struct member_remove;

template <>
struct member_remove<1> final {
  uint16_t version{1};
  context_type_t context_type{context_type_t::workspace};
  id_t context_id;
  user_id_t member_id;
};

using member_remove_t = member_remove<1>;

}  // namespace chronicle::schema
