#pragma once

#include <chronicle/schema/primitives.hpp>

#include <string>
#include <vector>

namespace chronicle::schema {

/// Governor output. Never stored on its own; it is recorded in the
/// metadata of the requested event and of the phase event it produces.
struct permission_decision_t final {
  bool granted{};
  bool needs_approval{};
  std::vector<user_id_t> approvers;
  std::string reason;

  bool operator==(const permission_decision_t&) const = default;
};

}  // namespace chronicle::schema
