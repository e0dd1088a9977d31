#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <custodia/schema/engine_options.hpp>
#include <custodia/tools/scenario.hpp>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

void configure_logging(const bool verbose, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto sinks = std::vector<spdlog::sink_ptr>{console_sink};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "main", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto verbose = false;
  auto config_path = std::string{};
  auto script_path = std::string{};
  auto log_file = std::string{};
  auto supervisor = std::string{};
  auto custodian = std::string{};
  auto registry = std::string{};
  auto start_height = uint64_t{};
  auto options = custodia::schema::engine_options_t{};

  auto description = po::options_description{"Custodia"};
  description.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable debug logging")(
      "config,c", po::value<std::string>(&config_path),
      "INI-style file with any of the long options below")(
      "script,s", po::value<std::string>(&script_path),
      "Scenario file to replay against an in-memory registry")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "Also write logs to this file");

  auto registry_options = po::options_description{"Registry"};
  registry_options.add_options()(
      "supervisor",
      po::value<std::string>(&supervisor)->default_value("supervisor"),
      "Label of the supervisor account")(
      "custodian",
      po::value<std::string>(&custodian)->default_value("custodian"),
      "Label of the custody account on the ledger")(
      "registry-id",
      po::value<std::string>(&registry)->default_value("custodia"),
      "Domain separator for signed operation digests")(
      "start-height", po::value<uint64_t>(&start_height)->default_value(1),
      "Initial block height")(
      "recent-window",
      po::value<uint64_t>(&options.recent_window)
          ->default_value(options.recent_window),
      "Maximum age of a recent timestamp, in blocks")(
      "max-duration",
      po::value<uint64_t>(&options.max_duration)
          ->default_value(options.max_duration),
      "Longest allowed allocation lifetime, in blocks")(
      "max-hold-duration",
      po::value<uint64_t>(&options.max_hold_duration)
          ->default_value(options.max_hold_duration),
      "Longest security hold, in blocks")(
      "max-rate-limit-window",
      po::value<uint64_t>(&options.max_rate_limit_window)
          ->default_value(options.max_rate_limit_window),
      "Longest rate-limit window, in blocks")(
      "max-multisig-signers",
      po::value<uint32_t>(&options.max_multisig_signers)
          ->default_value(options.max_multisig_signers),
      "Largest multisig signer set");
  description.add(registry_options);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto config = std::ifstream{vm["config"].as<std::string>()};
      if (!config) {
        std::cerr << "cannot open config file "
                  << vm["config"].as<std::string>() << std::endl;
        return 2;
      }
      po::store(po::parse_config_file(config, registry_options), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 2;
  }

  if (vm.contains("help") || script_path.empty()) {
    std::cout << description << std::endl;
    return vm.contains("help") ? 0 : 2;
  }
  if (vm.contains("verbose")) {
    verbose = true;
  }
  configure_logging(verbose, log_file);

  options.supervisor = custodia::tools::account_for_label(supervisor);
  options.registry_id = custodia::tools::account_for_label(registry);

  auto script = std::ifstream{script_path};
  if (!script) {
    spdlog::error("Cannot open scenario {}", script_path);
    spdlog::shutdown();
    return 2;
  }

  auto runner = custodia::tools::scenario_runner{
      options, custodia::tools::account_for_label(custodian), start_height};
  auto summary = runner.run_script(script);
  spdlog::info("{} step(s), {} rejected, {} unexpected, final height {}",
               summary.steps, summary.rejected, summary.unexpected,
               runner.height());

  auto exit_code = 0;
  if (summary.parse_error) {
    exit_code = 2;
  } else if (summary.unexpected != 0) {
    exit_code = 1;
  }
  spdlog::shutdown();
  return exit_code;
}
