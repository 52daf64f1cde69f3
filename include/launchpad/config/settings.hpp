#pragma once

#include <launchpad/liquidity/pool_manager.hpp>
#include <launchpad/schema/primitives.hpp>
#include <launchpad/schema/quorum_rule.hpp>

#include <boost/program_options.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace launchpad::config {

class settings_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct settings final {
  std::string db_path{"launchpad.db"};
  launchpad::schema::account_id_t administrator{};
  launchpad::schema::quorum_rule_t quorum{
      launchpad::schema::quorum_rule_t::all_but_one};
  launchpad::liquidity::vesting_policy vesting{};
  std::string log_level{"info"};
  std::string log_file{"launchpad.log"};
  std::optional<std::string> tx_file;
  bool verbose{false};
  bool help{false};
};

boost::program_options::options_description make_options_description();

/// Parse the command line, then the `--config` file if one is named.
/// Command-line values take precedence. Throws `settings_error`.
settings parse_settings(int argc, const char* const argv[]);

/// Build settings from already-parsed options. Throws `settings_error`.
settings make_settings(const boost::program_options::variables_map& vm);

}  // namespace launchpad::config
