#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <launchpad/config/settings.hpp>
#include <fstream>
#include <limits>

namespace po = boost::program_options;
using namespace launchpad::schema;

namespace launchpad::config {

namespace {

amount_t parse_amount(const std::string& name, const std::string& value) {
  auto amount = try_make_amount(value);
  if (!amount) {
    throw settings_error{
        fmt::format("--{} expects a 256-bit decimal, got '{}'", name, value)};
  }
  return *amount;
}

}  // namespace

po::options_description make_options_description() {
  auto description = po::options_description{"Launchpad"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI-style configuration file")(
      "db-path,d", po::value<std::string>()->default_value("launchpad.db"),
      "RocksDB directory")(
      "administrator,a", po::value<std::string>(),
      "Administrator identity, 64 hex characters")(
      "quorum,q", po::value<std::string>()->default_value("all-but-one"),
      "Quorum rule: all-but-one or unanimous")(
      "liquidity-threshold", po::value<std::string>()->default_value("1000000"),
      "Cumulative liquidity that earns a vesting grant")(
      "vesting-amount", po::value<std::string>()->default_value("100000"),
      "Amount of each vesting grant")(
      "vesting-duration-ms", po::value<uint64_t>()->default_value(2592000000),
      "Duration of each vesting grant in milliseconds")(
      "max-vesting-grants", po::value<uint32_t>()->default_value(10),
      "Vesting grants issued per pool")(
      "log-level,l", po::value<std::string>()->default_value("info"),
      "trace, debug, info, warn, error or critical")(
      "log-file", po::value<std::string>()->default_value("launchpad.log"),
      "Log file path")(
      "tx-file,t", po::value<std::string>(),
      "File of hex transactions, one per line; stdin when absent")(
      "verbose,v", "Enable verbose output");
  return description;
}

settings make_settings(const po::variables_map& vm) {
  auto result = settings{};
  result.help = vm.contains("help");
  result.verbose = vm.contains("verbose");
  if (result.help) {
    return result;
  }

  result.db_path = vm["db-path"].as<std::string>();
  if (result.db_path.empty()) {
    throw settings_error{"--db-path must not be empty"};
  }

  if (!vm.contains("administrator")) {
    throw settings_error{"--administrator is required"};
  }
  auto administrator =
      try_make_hash32(vm["administrator"].as<std::string>());
  if (!administrator || is_zero(*administrator)) {
    throw settings_error{"--administrator expects 64 hex characters"};
  }
  result.administrator = *administrator;

  auto quorum =
      try_from_string<quorum_rule_t>(vm["quorum"].as<std::string>());
  if (!quorum) {
    throw settings_error{
        fmt::format("unknown quorum rule '{}'", vm["quorum"].as<std::string>())};
  }
  result.quorum = *quorum;

  result.vesting.liquidity_threshold = parse_amount(
      "liquidity-threshold", vm["liquidity-threshold"].as<std::string>());
  if (result.vesting.liquidity_threshold == 0) {
    throw settings_error{"--liquidity-threshold must be positive"};
  }
  result.vesting.grant_amount =
      parse_amount("vesting-amount", vm["vesting-amount"].as<std::string>());
  if (result.vesting.grant_amount == 0) {
    throw settings_error{"--vesting-amount must be positive"};
  }
  result.vesting.grant_duration = vm["vesting-duration-ms"].as<uint64_t>();
  result.vesting.max_grants_per_pool = vm["max-vesting-grants"].as<uint32_t>();

  result.log_level = vm["log-level"].as<std::string>();
  if (spdlog::level::from_str(result.log_level) == spdlog::level::off &&
      result.log_level != "off") {
    throw settings_error{
        fmt::format("unknown log level '{}'", result.log_level)};
  }
  result.log_file = vm["log-file"].as<std::string>();
  if (vm.contains("tx-file")) {
    result.tx_file = vm["tx-file"].as<std::string>();
  }
  return result;
}

settings parse_settings(const int argc, const char* const argv[]) {
  auto description = make_options_description();
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        throw settings_error{
            fmt::format("cannot open configuration file '{}'", path)};
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    throw settings_error{e.what()};
  }
  return make_settings(vm);
}

}  // namespace launchpad::config
