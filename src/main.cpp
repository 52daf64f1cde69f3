#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <launchpad/config/settings.hpp>
#include <launchpad/execution/runtime.hpp>
#include <launchpad/schema/primitives.hpp>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

std::string trim(const std::string& line) {
  auto first = line.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  auto last = line.find_last_not_of(" \t\r\n");
  return line.substr(first, last - first + 1);
}

void apply_stream(launchpad::execution::engine& engine, std::istream& input) {
  auto line = std::string{};
  auto line_number = size_t{0};
  while (!shutdown_requested() && std::getline(input, line)) {
    ++line_number;
    auto hex = trim(line);
    if (hex.empty() || hex.starts_with('#')) {
      continue;
    }
    auto raw_tx = launchpad::schema::try_from_hex(hex);
    if (!raw_tx) {
      spdlog::warn("Line {}: not a hex transaction", line_number);
      std::cout << line_number << " code=1 log=invalid hex" << std::endl;
      continue;
    }
    auto result = engine.apply(launchpad::schema::make_bytes_view(*raw_tx));
    std::cout << line_number << " code=" << result.code;
    if (!result.data.empty()) {
      std::cout << " data=" << launchpad::schema::to_hex(
                                   launchpad::schema::make_bytes_view(
                                       result.data));
    }
    if (!result.log.empty()) {
      std::cout << " log=" << result.log;
    }
    for (const auto& event : result.events) {
      std::cout << " event=" << event.type;
    }
    std::cout << std::endl;
  }
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto settings = launchpad::config::settings{};
  try {
    settings = launchpad::config::parse_settings(argc, argv);
  } catch (const launchpad::config::settings_error& e) {
    std::cerr << "launchpadd: " << e.what() << std::endl;
    return 2;
  }
  if (settings.help) {
    std::cout << launchpad::config::make_options_description() << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(settings.verbose ? spdlog::level::debug
                                     : spdlog::level::from_str(
                                           settings.log_level));

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      settings.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "launchpad", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  spdlog::info("Administrator {}",
               launchpad::schema::to_hex(settings.administrator));
  auto runtime = launchpad::execution::runtime{settings};

  if (settings.tx_file) {
    auto file = std::ifstream{*settings.tx_file};
    if (!file) {
      spdlog::error("Cannot open transaction file {}", *settings.tx_file);
      spdlog::shutdown();
      return 1;
    }
    apply_stream(runtime.engine(), file);
  } else {
    apply_stream(runtime.engine(), std::cin);
  }

  spdlog::info("Shutting down");
  spdlog::shutdown();
  return 0;
}
