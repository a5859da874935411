#include <chronicle/config/options.hpp>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace chronicle::config {

namespace po = boost::program_options;

parse_result parse(int argc, const char* const argv[]) {
  auto result = parse_result{};
  auto& values = result.values;
  auto config_file = std::string{};
  auto realtime = std::string{"true"};

  auto general = po::options_description{"Chronicle"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with any of the settings below");

  auto settings = po::options_description{"Settings"};
  settings.add_options()(
      "data-dir", po::value<std::string>(&values.data_dir)
                      ->default_value(values.data_dir),
      "RocksDB directory")(
      "object-dir", po::value<std::string>(&values.object_dir),
      "Object store root (default <data-dir>/objects)")(
      "log-level", po::value<std::string>(&values.log_level)
                       ->default_value(values.log_level),
      "trace, debug, info, warn, error or critical")(
      "log-file", po::value<std::string>(&values.log_file)
                      ->default_value(values.log_file),
      "Log file path")(
      "webhook-secret", po::value<std::string>(&values.webhook_secret),
      "Shared secret for webhook ingestion; empty disables webhooks")(
      "max-attempts", po::value<uint32_t>(&values.max_attempts)
                          ->default_value(values.max_attempts),
      "Worker attempts per event")(
      "dispatch-threads", po::value<uint32_t>(&values.dispatch_threads)
                              ->default_value(values.dispatch_threads),
      "Dispatch executor threads")(
      "realtime", po::value<std::string>(&realtime)->default_value(realtime),
      "Enable real-time notification (true/false)");

  auto commands = po::options_description{"Operator commands"};
  commands.add_options()("stream", po::value<std::string>(),
                         "Print the event stream of a subject")(
      "verify-thread", po::value<std::string>(),
      "Verify the hash chain of a thread")(
      "rebuild-projections", "Regenerate projection rows from the event log")(
      "from", po::value<uint64_t>(),
      "Rebuild only events at or after this timestamp (ms)")(
      "failures", "List workers that exhausted their attempts");

  auto all = po::options_description{};
  all.add(general).add(settings).add(commands);

  auto usage = std::ostringstream{};
  usage << all;
  result.usage = usage.str();

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, all), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto in = std::ifstream{path};
      if (!in) {
        result.error = true;
        result.exit = true;
        result.usage = fmt::format("cannot read config file {}", path);
        return result;
      }
      po::store(po::parse_config_file(in, settings), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    result.error = true;
    result.exit = true;
    result.usage = fmt::format("{}\n{}", ex.what(), result.usage);
    return result;
  }

  if (vm.contains("help")) {
    result.exit = true;
    return result;
  }
  if (realtime != "true" && realtime != "false") {
    result.error = true;
    result.exit = true;
    result.usage = fmt::format("realtime must be true or false, got '{}'",
                               realtime);
    return result;
  }
  values.realtime = realtime == "true";
  if (values.object_dir.empty()) {
    values.object_dir =
        (std::filesystem::path{values.data_dir} / "objects").string();
  }
  if (vm.contains("stream")) {
    values.stream_subject = vm["stream"].as<std::string>();
  }
  if (vm.contains("verify-thread")) {
    values.verify_thread = vm["verify-thread"].as<std::string>();
  }
  values.rebuild_projections = vm.contains("rebuild-projections");
  if (vm.contains("from")) {
    values.rebuild_from = vm["from"].as<uint64_t>();
  }
  values.list_failures = vm.contains("failures");
  return result;
}

}  // namespace chronicle::config
