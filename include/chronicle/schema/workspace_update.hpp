#pragma once

#include <chronicle/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace chronicle::schema {

template <uint16_t Version>
struct workspace_update;

template <>
struct workspace_update<1> final {
  uint16_t version{1};
  id_t workspace_id;
  std::optional<std::string> name;
  std::optional<bool> ai_auto_approve;
};

using workspace_update_t = workspace_update<1>;

}  // namespace chronicle::schema
