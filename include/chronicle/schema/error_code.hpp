#pragma once

#include <cstdint>

namespace chronicle::schema {

enum class error_code : uint32_t {
  ok = 0,
  schema_validation_failed = 1,
  malformed_event_type = 2,
  payload_mismatch = 3,
  duplicate_schema = 4,
  duplicate_event = 10,
  version_conflict = 11,
  event_not_found = 12,
  resource_not_found = 13,
  scope_violation = 14,
  not_pending = 20,
  not_an_approver = 21,
  webhooks_disabled = 30,
  unauthorized = 31,
  invalid_token = 32,
  correlation_mismatch = 33,
  confidence_out_of_range = 34,
  thread_not_found = 40,
  message_not_found = 41,
  thread_not_active = 42,
  stream_failed = 43,
};

inline constexpr uint32_t to_code(const error_code code) {
  return static_cast<uint32_t>(code);
}

}  // namespace chronicle::schema
