#pragma once

#include <chronicle/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: workspaces.create payload.
// The acting user becomes the workspace owner.
namespace chronicle::schema {

template <uint16_t Version>
struct workspace_create;

template <>
struct workspace_create<1> final {
  uint16_t version{1};
  std::optional<id_t> workspace_id;
  std::string name;
  bool ai_auto_approve{};
};

using workspace_create_t = workspace_create<1>;

}  // namespace chronicle::schema
