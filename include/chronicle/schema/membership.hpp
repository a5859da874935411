#pragma once

#include <chronicle/schema/context_type.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/role.hpp>

#include <cstdint>
#include <string>

namespace chronicle::schema {

template <uint16_t Version>
struct membership;

template <>
struct membership<1> final {
  uint16_t version{1};
  context_type_t context_type{context_type_t::workspace};
  id_t context_id;
  user_id_t user_id;
  role_t role{role_t::viewer};
  timestamp_milliseconds_t granted_at{};
};

using membership_t = membership<1>;

template <uint16_t Version>
struct workspace_settings;

/// Per-workspace switches consulted by the governor.
template <>
struct workspace_settings<1> final {
  uint16_t version{1};
  id_t workspace_id;
  std::string name;
  user_id_t owner_id;
  bool ai_auto_approve{};
  timestamp_milliseconds_t created_at{};
};

using workspace_settings_t = workspace_settings<1>;

}  // namespace chronicle::schema
