#pragma once

#include <chronicle/schema/primitives.hpp>

#include <cstdint>

namespace chronicle::schema {

template <uint16_t Version>
struct unvalidated_payload;

/// Raw payload of an event type no schema was registered for. Carried
/// through untouched and never interpreted.
template <>
struct unvalidated_payload<1> final {
  uint16_t version{1};
  bytes_t raw;
};

using unvalidated_payload_t = unvalidated_payload<1>;

}  // namespace chronicle::schema
