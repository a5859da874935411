#pragma once

#include <chronicle/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace chronicle::schema {

template <uint16_t Version>
struct execution_failure;

/// Audit record of a worker that exhausted its attempts on an event.
template <>
struct execution_failure<1> final {
  uint16_t version{1};
  std::string worker;
  id_t event_id;
  std::string event_type;
  uint32_t attempts{};
  std::string last_error;
  timestamp_milliseconds_t failed_at{};
};

using execution_failure_t = execution_failure<1>;

}  // namespace chronicle::schema
