#include <csignal>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <chronicle/common/logging.hpp>
#include <chronicle/config/options.hpp>
#include <chronicle/pipeline/pipeline.hpp>
#include <chronicle/schema/event_type.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <thread>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

namespace {

int print_stream(chronicle::pipeline::pipeline& pipeline,
                 const std::string& subject) {
  auto events = pipeline.store().get_aggregate_stream(subject);
  for (const auto& stored : events) {
    const auto& event = stored.event;
    auto decision = std::string{};
    if (event.metadata.approval) {
      decision = fmt::format(" [{}]", event.metadata.approval->reason);
    }
    fmt::print("v{} seq={} {} {} user={} at={}{}\n", stored.aggregate_version,
               stored.sequence, event.type, event.id,
               event.user_id.value_or("-"), event.timestamp, decision);
  }
  spdlog::info("{} event(s) for {}", events.size(), subject);
  return 0;
}

int verify_thread(chronicle::pipeline::pipeline& pipeline,
                  const std::string& thread_id) {
  auto result = pipeline.threads().verify(thread_id);
  if (result.valid) {
    fmt::print("thread {} intact ({} message(s))\n", thread_id, result.checked);
    return 0;
  }
  fmt::print("thread {} BROKEN at {} ({} of {} message(s) mismatched)\n",
             thread_id, result.broken_at.value_or("<missing thread>"),
             result.mismatches, result.checked);
  return 1;
}

int list_failures(chronicle::pipeline::pipeline& pipeline) {
  auto failures = pipeline.runner().list_failures();
  for (const auto& failure : failures) {
    fmt::print("{} {} {} attempts={} failed_at={}: {}\n", failure.worker,
               failure.event_type, failure.event_id, failure.attempts,
               failure.failed_at, failure.last_error);
  }
  fmt::print("{} terminal failure(s)\n", failures.size());
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto parsed = chronicle::config::parse(argc, argv);
  if (parsed.exit) {
    (parsed.error ? std::cerr : std::cout) << parsed.usage << std::endl;
    return parsed.error ? 1 : 0;
  }
  const auto& options = parsed.values;
  chronicle::common::configure_logging(options.log_level, options.log_file);

  try {
    auto storage = chronicle::storage::make_storage<
        chronicle::storage::rocksdb_storage_tag>(options.data_dir);
    auto objects = chronicle::workers::filesystem_object_store{options.object_dir};
    auto hub = chronicle::workers::subscription_hub{};

    auto pipeline = chronicle::pipeline::pipeline{
        storage, objects, hub,
        chronicle::pipeline::pipeline_options{
            .max_attempts = options.max_attempts,
            .dispatch_threads = options.dispatch_threads,
            .realtime = options.realtime,
            .webhook_secret = options.webhook_secret}};

    auto status = 0;
    if (options.stream_subject) {
      status = print_stream(pipeline, *options.stream_subject);
    } else if (options.verify_thread) {
      status = verify_thread(pipeline, *options.verify_thread);
    } else if (options.rebuild_projections) {
      auto stats =
          pipeline.projections().rebuild(pipeline.store(), options.rebuild_from);
      fmt::print("processed={} projected={} errors={}\n", stats.processed,
                 stats.projected, stats.errors);
      status = stats.errors == 0 ? 0 : 1;
    } else if (options.list_failures) {
      status = list_failures(pipeline);
    } else {
      spdlog::info("chronicled running on {} (Ctrl-C to stop)",
                   options.data_dir);
      while (!shutdown_requested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
      }
      spdlog::info("Shutdown requested; draining dispatch");
    }
    pipeline.shutdown();
    spdlog::shutdown();
    return status;
  } catch (const std::exception& ex) {
    spdlog::critical("chronicled failed: {}", ex.what());
    spdlog::shutdown();
    return 1;
  }
}
