#pragma once

#include <chronicle/events/event_store.hpp>
#include <chronicle/schema/event.hpp>
#include <chronicle/schema/execution_failure.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::execution {

struct job_outcome final {
  bool success{};
  uint32_t attempts{};
  std::string last_error;
  std::optional<chronicle::schema::error_code> failure_code;
};

/// Worker-level retry loop. A body that keeps failing is given up after
/// `max_attempts`; the failure is then written to the audit table, noted on
/// the originating event and logged for operators.
class job_runner final {
 public:
  job_runner(chronicle::storage::rocksdb_storage_t& storage,
             chronicle::events::event_store& store,
             uint32_t max_attempts = 3,
             std::chrono::milliseconds backoff = std::chrono::milliseconds{0});

  job_outcome run(const std::string_view worker,
                  const chronicle::schema::stored_event_t& event,
                  const std::function<void()>& body);

  std::vector<chronicle::schema::execution_failure_t> list_failures() const;

  std::optional<chronicle::schema::execution_failure_t> failure(
      const std::string_view event_id,
      const std::string_view worker) const;

  uint32_t max_attempts() const { return max_attempts_; }

 private:
  void record_failure(const std::string_view worker,
                      const chronicle::schema::stored_event_t& event,
                      const job_outcome& outcome);

  chronicle::storage::rocksdb_storage_t& storage_;
  chronicle::events::event_store& store_;
  uint32_t max_attempts_;
  std::chrono::milliseconds backoff_;
};

}  // namespace chronicle::execution
