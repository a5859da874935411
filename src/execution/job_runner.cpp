#include <chronicle/common/ids.hpp>
#include <chronicle/execution/job_runner.hpp>
#include <chronicle/execution/step_failure.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/key/builder.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <thread>

namespace chronicle::execution {

namespace {

using encoder_t = chronicle::schema::encoding::scale_encoder_t;

chronicle::schema::key::builder failure_key(const std::string_view event_id,
                                            const std::string_view worker) {
  auto key = chronicle::schema::key::builder{};
  key.segment("FAIL").segment(event_id).write(worker);
  return key;
}

}  // namespace

job_runner::job_runner(chronicle::storage::rocksdb_storage_t& storage,
                       chronicle::events::event_store& store,
                       uint32_t max_attempts,
                       std::chrono::milliseconds backoff)
    : storage_{storage},
      store_{store},
      max_attempts_{max_attempts == 0 ? 1 : max_attempts},
      backoff_{backoff} {}

job_outcome job_runner::run(const std::string_view worker,
                            const chronicle::schema::stored_event_t& event,
                            const std::function<void()>& body) {
  auto outcome = job_outcome{};
  while (outcome.attempts < max_attempts_) {
    ++outcome.attempts;
    try {
      body();
      outcome.success = true;
      outcome.last_error.clear();
      if (outcome.attempts > 1) {
        spdlog::info("{} succeeded on attempt {} for {}", worker,
                     outcome.attempts, event.event.id);
      }
      return outcome;
    } catch (const step_failure& ex) {
      outcome.last_error = ex.what();
      outcome.failure_code = ex.code();
      spdlog::warn("{} failed permanently on {}: {}", worker, event.event.id,
                   ex.what());
      break;
    } catch (const std::exception& ex) {
      outcome.last_error = ex.what();
      spdlog::warn("{} attempt {}/{} failed on {}: {}", worker,
                   outcome.attempts, max_attempts_, event.event.id, ex.what());
    } catch (...) {
      outcome.last_error = "unknown exception";
      spdlog::warn("{} attempt {}/{} failed on {} with a non-standard exception",
                   worker, outcome.attempts, max_attempts_, event.event.id);
    }
    if (outcome.attempts < max_attempts_ && backoff_.count() > 0) {
      std::this_thread::sleep_for(backoff_ * outcome.attempts);
    }
  }
  record_failure(worker, event, outcome);
  return outcome;
}

void job_runner::record_failure(const std::string_view worker,
                                const chronicle::schema::stored_event_t& event,
                                const job_outcome& outcome) {
  auto record = chronicle::schema::execution_failure_t{};
  record.worker = std::string{worker};
  record.event_id = event.event.id;
  record.event_type = event.event.type;
  record.attempts = outcome.attempts;
  record.last_error = outcome.last_error;
  record.failed_at = chronicle::common::now_ms();

  auto encoder = encoder_t{};
  auto key = failure_key(record.event_id, worker);
  storage_.put(encoder, key.view(), record);

  auto annotated = store_.add_annotation(event.event.id, "execution.failed",
                                         worker);
  if (annotated.code != 0) {
    spdlog::warn("Could not annotate {} with execution failure: {}",
                 event.event.id, annotated.log);
  }
  spdlog::error("{} gave up on {} ({}) after {} attempt(s): {}", worker,
                event.event.id, event.event.type, outcome.attempts,
                outcome.last_error);
}

std::vector<chronicle::schema::execution_failure_t> job_runner::list_failures()
    const {
  auto encoder = encoder_t{};
  auto prefix = chronicle::schema::key::builder{};
  prefix.segment("FAIL");
  return storage_.scan<encoder_t, chronicle::schema::execution_failure_t>(
      encoder, prefix.view());
}

std::optional<chronicle::schema::execution_failure_t> job_runner::failure(
    const std::string_view event_id,
    const std::string_view worker) const {
  auto encoder = encoder_t{};
  auto key = failure_key(event_id, worker);
  return storage_.get<encoder_t, chronicle::schema::execution_failure_t>(
      encoder, key.view());
}

}  // namespace chronicle::execution
