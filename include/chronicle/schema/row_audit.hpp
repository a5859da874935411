#pragma once

#include <chronicle/schema/primitives.hpp>

#include <optional>

namespace chronicle::schema {

/// Bookkeeping shared by every worker-owned row. A set `deleted_at` is the
/// soft delete marker; rows are never physically removed.
struct row_audit_t final {
  id_t source_event_id;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
  std::optional<timestamp_milliseconds_t> deleted_at;
};

}  // namespace chronicle::schema
