#include <chronicle/execution/step_journal.hpp>

namespace chronicle::execution {

step_journal::step_journal(chronicle::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

chronicle::schema::key::builder step_journal::prefix(
    const std::string_view execution_id) {
  auto key = chronicle::schema::key::builder{};
  key.segment("STEP").segment(execution_id);
  return key;
}

bool step_journal::completed(const std::string_view execution_id,
                             const std::string_view step) const {
  auto key = prefix(execution_id);
  key.write(step);
  return storage_.contains(key.view());
}

std::vector<std::string> step_journal::completed_steps(
    const std::string_view execution_id) const {
  auto base = prefix(execution_id);
  auto steps = std::vector<std::string>{};
  for (const auto& [key, value] : storage_.list_by_prefix(base.view())) {
    steps.emplace_back(reinterpret_cast<const char*>(key.data()) +
                           base.data.size(),
                       key.size() - base.data.size());
  }
  return steps;
}

}  // namespace chronicle::execution
