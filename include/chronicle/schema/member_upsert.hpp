#pragma once

#include <chronicle/schema/context_type.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/role.hpp>

#include <cstdint>

namespace chronicle::schema {

template <uint16_t Version>
struct member_upsert;

/// Grant `role` to `member_id` in a workspace or project.
template <>
struct member_upsert<1> final {
  uint16_t version{1};
  context_type_t context_type{context_type_t::workspace};
  id_t context_id;
  user_id_t member_id;
  role_t role{role_t::viewer};
};

using member_upsert_t = member_upsert<1>;

}  // namespace chronicle::schema
