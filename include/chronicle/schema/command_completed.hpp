#pragma once

#include <chronicle/schema/object_ref.hpp>
#include <chronicle/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace chronicle::schema {

template <uint16_t Version>
struct command_completed;

/// Payload of every `{subject}.{action}.completed` event.
template <>
struct command_completed<1> final {
  uint16_t version{1};
  id_t validated_event_id;
  id_t resource_id;
  uint64_t resource_version{};
  std::optional<object_ref_t> content;
  std::string summary;
};

using command_completed_t = command_completed<1>;

}  // namespace chronicle::schema
