#pragma once

#include <chronicle/schema/message_role.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/thread_status.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace chronicle::schema {

template <uint16_t Version>
struct thread;

/// Node of the branch tree. Parent links are ids, never pointers.
/// `seed_hash` is the previous hash of the first message: empty for a root
/// thread, the hash of `branched_from_message_id` for a branch.
template <>
struct thread<1> final {
  uint16_t version{1};
  id_t id;
  user_id_t user_id;
  std::string title;
  std::optional<id_t> parent_thread_id;
  std::optional<id_t> branched_from_message_id;
  std::string seed_hash;
  std::optional<std::string> branch_purpose;
  thread_status_t status{thread_status_t::active};
  std::optional<std::string> context_summary;
  timestamp_milliseconds_t created_at{};
  std::optional<timestamp_milliseconds_t> merged_at;
};

using thread_t = thread<1>;

template <uint16_t Version>
struct message;

template <>
struct message<1> final {
  uint16_t version{1};
  id_t id;
  id_t thread_id;
  uint64_t position{};
  message_role_t role{message_role_t::user};
  user_id_t user_id;
  std::string content;
  std::string previous_hash;
  std::string hash;
  timestamp_milliseconds_t created_at{};
};

using message_t = message<1>;

}  // namespace chronicle::schema
