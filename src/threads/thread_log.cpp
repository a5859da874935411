#include <chronicle/common/ids.hpp>
#include <chronicle/crypto/digest.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/key/builder.hpp>
#include <chronicle/threads/thread_log.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <deque>

namespace chronicle::threads {

using namespace chronicle::schema;

namespace {

using encoder_t = chronicle::schema::encoding::scale_encoder_t;

key::builder thread_key(const std::string_view thread_id) {
  auto key = key::builder{};
  key.segment("THR").write(thread_id);
  return key;
}

key::builder children_prefix(const std::string_view parent_id) {
  auto key = key::builder{};
  key.segment("THR-CHILD").segment(parent_id);
  return key;
}

key::builder messages_prefix(const std::string_view thread_id) {
  auto key = key::builder{};
  key.segment("MSG").segment(thread_id);
  return key;
}

key::builder head_key(const std::string_view thread_id) {
  auto key = key::builder{};
  key.segment("MSG-HEAD").write(thread_id);
  return key;
}

key::builder locator_key(const std::string_view message_id) {
  auto key = key::builder{};
  key.segment("MSG-ID").write(message_id);
  return key;
}

thread_result thread_error(const error_code code, std::string log) {
  return thread_result{.code = to_code(code), .log = std::move(log)};
}

message_result message_error(const error_code code, std::string log) {
  return message_result{.code = to_code(code), .log = std::move(log)};
}

}  // namespace

thread_log::thread_log(chronicle::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

std::string thread_log::chain_hash(const std::string_view message_id,
                                   const std::string_view content,
                                   const std::string_view previous_hash) {
  return chronicle::crypto::sha256_hex({message_id, content, previous_hash});
}

void thread_log::save(const thread_t& thread) {
  auto encoder = encoder_t{};
  storage_.put(encoder, thread_key(thread.id).view(), thread);
}

std::optional<thread_t> thread_log::thread(
    const std::string_view thread_id) const {
  auto encoder = encoder_t{};
  return storage_.get<encoder_t, thread_t>(encoder, thread_key(thread_id).view());
}

std::optional<message_t> thread_log::message(
    const std::string_view message_id) const {
  auto encoder = encoder_t{};
  auto locator = storage_.get<encoder_t, message_locator_t>(
      encoder, locator_key(message_id).view());
  if (!locator) {
    return std::nullopt;
  }
  return storage_.get<encoder_t, message_t>(
      encoder,
      messages_prefix(locator->thread_id).write(locator->position).view());
}

std::optional<message_t> thread_log::last_message(
    const std::string_view thread_id) const {
  auto encoder = encoder_t{};
  auto head = storage_.get<encoder_t, uint64_t>(encoder,
                                                head_key(thread_id).view());
  if (!head) {
    return std::nullopt;
  }
  return storage_.get<encoder_t, message_t>(
      encoder, messages_prefix(thread_id).write(*head).view());
}

thread_result thread_log::create_thread(const std::string_view user_id,
                                        const std::string_view title) {
  auto created = thread_t{};
  created.id = chronicle::common::make_uuid();
  created.user_id = std::string{user_id};
  created.title = std::string{title};
  created.created_at = chronicle::common::now_ms();
  save(created);
  spdlog::info("Thread {} created for {}", created.id, user_id);
  return thread_result{.thread = std::move(created)};
}

message_result thread_log::append_message(const std::string_view thread_id,
                                          const std::string_view content,
                                          const message_role_t role,
                                          const std::string_view user_id) {
  auto lock = std::scoped_lock{write_mutex_};
  auto target = thread(thread_id);
  if (!target) {
    return message_error(error_code::thread_not_found,
                         fmt::format("thread {} not found", thread_id));
  }
  return append_locked(*target, content, role, user_id);
}

message_result thread_log::append_locked(const thread_t& target,
                                         const std::string_view content,
                                         const message_role_t role,
                                         const std::string_view user_id) {
  if (target.status != thread_status_t::active) {
    return message_error(error_code::thread_not_active,
                         fmt::format("thread {} is {}", target.id,
                                     to_string(target.status)));
  }
  auto previous = last_message(target.id);

  auto appended = message_t{};
  appended.id = chronicle::common::make_uuid();
  appended.thread_id = target.id;
  appended.position = previous ? previous->position + 1 : 1;
  appended.role = role;
  appended.user_id = std::string{user_id};
  appended.content = std::string{content};
  appended.previous_hash = previous ? previous->hash : target.seed_hash;
  appended.hash =
      chain_hash(appended.id, appended.content, appended.previous_hash);
  appended.created_at = chronicle::common::now_ms();

  auto encoder = encoder_t{};
  auto batch = chronicle::storage::write_batch{};
  batch.put(encoder,
            messages_prefix(target.id).write(appended.position).view(),
            appended);
  batch.put(encoder, head_key(target.id).view(), appended.position);
  batch.put(encoder, locator_key(appended.id).view(),
            message_locator_t{.thread_id = target.id,
                              .position = appended.position});
  storage_.commit(batch);
  spdlog::debug("Message {} appended to {} at {}", appended.id, target.id,
                appended.position);
  return message_result{.message = std::move(appended)};
}

thread_result thread_log::branch(const std::string_view parent_thread_id,
                                 const std::string_view from_message_id,
                                 const std::string_view user_id,
                                 std::optional<std::string> purpose) {
  auto lock = std::scoped_lock{write_mutex_};
  auto parent = thread(parent_thread_id);
  if (!parent) {
    return thread_error(error_code::thread_not_found,
                        fmt::format("thread {} not found", parent_thread_id));
  }
  auto from = message(from_message_id);
  if (!from || from->thread_id != parent->id) {
    return thread_error(
        error_code::message_not_found,
        fmt::format("message {} is not in thread {}", from_message_id,
                    parent_thread_id));
  }

  auto created = thread_t{};
  created.id = chronicle::common::make_uuid();
  created.user_id = std::string{user_id};
  created.title = fmt::format("Branch of {}", parent->title);
  created.parent_thread_id = parent->id;
  created.branched_from_message_id = from->id;
  created.seed_hash = from->hash;
  created.branch_purpose = std::move(purpose);
  created.created_at = chronicle::common::now_ms();

  auto encoder = encoder_t{};
  auto batch = chronicle::storage::write_batch{};
  batch.put(encoder, thread_key(created.id).view(), created);
  batch.put(encoder, children_prefix(parent->id).write(created.id).view(),
            created.id);
  storage_.commit(batch);
  spdlog::info("Thread {} branched from {} at message {}", created.id,
               parent->id, from->id);
  return thread_result{.thread = std::move(created)};
}

message_result thread_log::merge(const std::string_view branch_id,
                                 const std::string_view summary,
                                 const std::string_view user_id) {
  auto lock = std::scoped_lock{write_mutex_};
  auto branch_thread = thread(branch_id);
  if (!branch_thread) {
    return message_error(error_code::thread_not_found,
                         fmt::format("thread {} not found", branch_id));
  }
  if (!branch_thread->parent_thread_id) {
    return message_error(error_code::thread_not_found,
                         fmt::format("thread {} is not a branch", branch_id));
  }
  if (branch_thread->status != thread_status_t::active) {
    return message_error(error_code::thread_not_active,
                         fmt::format("branch {} is {}", branch_id,
                                     to_string(branch_thread->status)));
  }
  auto parent = thread(*branch_thread->parent_thread_id);
  if (!parent) {
    return message_error(
        error_code::thread_not_found,
        fmt::format("parent thread {} not found",
                    *branch_thread->parent_thread_id));
  }

  auto terminal = last_message(branch_thread->id);
  auto terminal_hash = terminal ? terminal->hash : branch_thread->seed_hash;
  auto content = fmt::format("[merge] branch={} terminal_hash={}\n{}",
                             branch_thread->id, terminal_hash, summary);
  auto appended =
      append_locked(*parent, content, message_role_t::system, user_id);
  if (appended.code != 0) {
    return appended;
  }

  branch_thread->status = thread_status_t::merged;
  branch_thread->context_summary = std::string{summary};
  branch_thread->merged_at = chronicle::common::now_ms();
  save(*branch_thread);
  spdlog::info("Branch {} merged into {}", branch_thread->id, parent->id);
  return appended;
}

thread_result thread_log::archive(const std::string_view thread_id) {
  auto lock = std::scoped_lock{write_mutex_};
  auto target = thread(thread_id);
  if (!target) {
    return thread_error(error_code::thread_not_found,
                        fmt::format("thread {} not found", thread_id));
  }
  target->status = thread_status_t::archived;
  save(*target);
  return thread_result{.thread = std::move(target)};
}

verification_result thread_log::verify(const std::string_view thread_id) const {
  auto result = verification_result{};
  auto target = thread(thread_id);
  if (!target) {
    result.valid = false;
    return result;
  }
  auto expected_previous = target->seed_hash;
  for (const auto& entry : history(thread_id)) {
    ++result.checked;
    auto recomputed = chain_hash(entry.id, entry.content, expected_previous);
    if (entry.previous_hash != expected_previous || entry.hash != recomputed) {
      ++result.mismatches;
      if (!result.broken_at) {
        result.broken_at = entry.id;
      }
    }
    expected_previous = std::move(recomputed);
  }
  result.valid = result.mismatches == 0;
  if (!result.valid) {
    spdlog::warn("Thread {} failed verification at {} ({} mismatch(es))",
                 thread_id, *result.broken_at, result.mismatches);
  }
  return result;
}

std::vector<message_t> thread_log::history(
    const std::string_view thread_id) const {
  auto encoder = encoder_t{};
  return storage_.scan<encoder_t, message_t>(encoder,
                                             messages_prefix(thread_id).view());
}

std::vector<thread_t> thread_log::branches(
    const std::string_view thread_id) const {
  auto encoder = encoder_t{};
  auto found = std::vector<thread_t>{};
  for (const auto& child_id : storage_.scan<encoder_t, id_t>(
           encoder, children_prefix(thread_id).view())) {
    if (auto child = thread(child_id)) {
      found.push_back(std::move(*child));
    }
  }
  return found;
}

branch_tree_t thread_log::branch_tree(const std::string_view root_id) const {
  auto tree = branch_tree_t{};
  tree.root_id = std::string{root_id};
  auto root = thread(root_id);
  if (!root) {
    return tree;
  }
  auto pending = std::deque<thread_t>{std::move(*root)};
  while (!pending.empty()) {
    auto current = std::move(pending.front());
    pending.pop_front();
    auto& children = tree.children[current.id];
    for (auto& child : branches(current.id)) {
      if (tree.threads.contains(child.id)) {
        continue;
      }
      children.push_back(child.id);
      pending.push_back(std::move(child));
    }
    tree.threads.emplace(current.id, std::move(current));
  }
  return tree;
}

message_result thread_log::append_streamed(const std::string_view thread_id,
                                           const message_role_t role,
                                           const std::string_view user_id,
                                           stream_channel_t& channel) {
  auto content = std::string{};
  auto result = message_result{};
  while (true) {
    auto chunk = channel.pop();
    if (!chunk) {
      result = message_error(error_code::stream_failed,
                             "stream closed before completion");
      break;
    }
    if (chunk->kind == stream_chunk_kind::content) {
      content += chunk->text;
      continue;
    }
    if (chunk->kind == stream_chunk_kind::error) {
      result = message_error(error_code::stream_failed,
                             fmt::format("stream failed: {}", chunk->text));
      break;
    }
    result = append_message(thread_id, content, role, user_id);
    break;
  }
  channel.close();
  if (result.code != 0) {
    spdlog::warn("Streamed append to {} abandoned: {}", thread_id, result.log);
  }
  return result;
}

}  // namespace chronicle::threads
