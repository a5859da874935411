#pragma once

#include <chronicle/execution/bounded_channel.hpp>
#include <chronicle/schema/thread.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::threads {

struct thread_result final {
  uint32_t code{};
  std::string log;
  std::optional<chronicle::schema::thread_t> thread;
};

struct message_result final {
  uint32_t code{};
  std::string log;
  std::optional<chronicle::schema::message_t> message;
};

struct verification_result final {
  bool valid{true};
  /// First message whose stored link or hash disagrees with the recomputed
  /// chain.
  std::optional<chronicle::schema::id_t> broken_at;
  uint64_t checked{};
  uint64_t mismatches{};
};

/// Threads reachable from a root, as an adjacency list keyed by id.
struct branch_tree_t final {
  chronicle::schema::id_t root_id;
  std::map<chronicle::schema::id_t, chronicle::schema::thread_t> threads;
  std::map<chronicle::schema::id_t, std::vector<chronicle::schema::id_t>>
      children;
};

enum class stream_chunk_kind : uint8_t { content = 0, complete = 1, error = 2 };

/// Incremental model output. A stream is any number of content chunks
/// followed by exactly one complete or error marker.
struct stream_chunk_t final {
  stream_chunk_kind kind{stream_chunk_kind::content};
  std::string text;
};

using stream_channel_t = chronicle::execution::bounded_channel<stream_chunk_t>;

/// Where a message lives; indexed by message id.
struct message_locator_t final {
  chronicle::schema::id_t thread_id;
  uint64_t position{};
};

/// Append-only, hash-chained conversation log with branching and merging.
///
/// Each message stores `hash = SHA256(id || content || previous_hash)` as
/// lowercase hex. A branch starts its own chain seeded with the hash of the
/// message it branched from, so it verifies independently of its parent.
class thread_log final {
 public:
  explicit thread_log(chronicle::storage::rocksdb_storage_t& storage);

  thread_result create_thread(const std::string_view user_id,
                              const std::string_view title);

  message_result append_message(const std::string_view thread_id,
                                const std::string_view content,
                                const chronicle::schema::message_role_t role,
                                const std::string_view user_id);

  thread_result branch(const std::string_view parent_thread_id,
                       const std::string_view from_message_id,
                       const std::string_view user_id,
                       std::optional<std::string> purpose = std::nullopt);

  /// Append a system message to the parent carrying the branch id, its
  /// terminal hash and `summary`, then mark the branch merged.
  message_result merge(const std::string_view branch_id,
                       const std::string_view summary,
                       const std::string_view user_id);

  thread_result archive(const std::string_view thread_id);

  verification_result verify(const std::string_view thread_id) const;

  std::optional<chronicle::schema::thread_t> thread(
      const std::string_view thread_id) const;

  std::optional<chronicle::schema::message_t> message(
      const std::string_view message_id) const;

  /// Messages in chain order.
  std::vector<chronicle::schema::message_t> history(
      const std::string_view thread_id) const;

  /// Direct branches of a thread.
  std::vector<chronicle::schema::thread_t> branches(
      const std::string_view thread_id) const;

  branch_tree_t branch_tree(const std::string_view root_id) const;

  /// Drain `channel` and append the assembled content as one message when
  /// the complete marker arrives. The channel is closed on return, so a
  /// producer still pushing sees push() fail.
  message_result append_streamed(const std::string_view thread_id,
                                 const chronicle::schema::message_role_t role,
                                 const std::string_view user_id,
                                 stream_channel_t& channel);

  static std::string chain_hash(const std::string_view message_id,
                                const std::string_view content,
                                const std::string_view previous_hash);

 private:
  void save(const chronicle::schema::thread_t& thread);
  std::optional<chronicle::schema::message_t> last_message(
      const std::string_view thread_id) const;
  message_result append_locked(const chronicle::schema::thread_t& thread,
                               const std::string_view content,
                               const chronicle::schema::message_role_t role,
                               const std::string_view user_id);

  chronicle::storage::rocksdb_storage_t& storage_;
  std::mutex write_mutex_;
};

}  // namespace chronicle::threads
