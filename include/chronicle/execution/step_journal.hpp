#pragma once

#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/key/builder.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace chronicle::execution {

/// Durable memo of completed worker steps keyed by (execution id, step name).
/// A redelivered event replays the job body; completed steps return their
/// recorded result instead of running again.
class step_journal final {
 public:
  explicit step_journal(chronicle::storage::rocksdb_storage_t& storage);

  template <typename Fn>
  auto run(const std::string_view execution_id,
           const std::string_view step,
           Fn&& fn) -> std::invoke_result_t<Fn>;

  bool completed(const std::string_view execution_id,
                 const std::string_view step) const;

  /// Names of recorded steps of one execution, in key order.
  std::vector<std::string> completed_steps(
      const std::string_view execution_id) const;

 private:
  using encoder_t = chronicle::schema::encoding::scale_encoder_t;

  static chronicle::schema::key::builder prefix(
      const std::string_view execution_id);

  chronicle::storage::rocksdb_storage_t& storage_;
};

template <typename Fn>
auto step_journal::run(const std::string_view execution_id,
                       const std::string_view step,
                       Fn&& fn) -> std::invoke_result_t<Fn> {
  using result_t = std::invoke_result_t<Fn>;
  auto key = prefix(execution_id);
  key.write(step);
  auto encoder = encoder_t{};
  if constexpr (std::is_void_v<result_t>) {
    if (storage_.contains(key.view())) {
      spdlog::debug("Step {}/{} already completed", execution_id, step);
      return;
    }
    fn();
    storage_.put(encoder, key.view(), true);
  } else {
    if (auto memo = storage_.get<encoder_t, result_t>(encoder, key.view())) {
      spdlog::debug("Step {}/{} already completed", execution_id, step);
      return *memo;
    }
    auto result = fn();
    storage_.put(encoder, key.view(), result);
    return result;
  }
}

}  // namespace chronicle::execution
