#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <launchpad/common/error.hpp>
#include <launchpad/execution/authorization_policy.hpp>

#include <mutex>

using namespace launchpad::schema;

namespace launchpad::execution {

void authorization_policy::require(const account_id_t& caller,
                                   const capability_t capability) const {
  if (!permits(caller, capability)) {
    launchpad::common::fail(
        transaction_error_code::not_authorized,
        fmt::format("{} lacks capability {}", to_hex(caller),
                    to_string(capability)));
  }
}

void authorization_policy::require_or_administrator(
    const account_id_t& caller,
    const capability_t capability) const {
  if (permits(caller, capability) ||
      permits(caller, capability_t::administer)) {
    return;
  }
  launchpad::common::fail(
      transaction_error_code::not_authorized,
      fmt::format("{} lacks capability {} and is not an administrator",
                  to_hex(caller), to_string(capability)));
}

role_table_policy::role_table_policy(const account_id_t& administrator) {
  grants_[capability_t::administer].insert(administrator);
}

bool role_table_policy::permits(const account_id_t& caller,
                                const capability_t capability) const {
  auto lock = std::shared_lock{mutex_};
  auto it = grants_.find(capability);
  return it != std::end(grants_) && it->second.contains(caller);
}

void role_table_policy::grant(const capability_t capability,
                              const account_id_t& identity) {
  auto lock = std::unique_lock{mutex_};
  grants_[capability].insert(identity);
  spdlog::debug("Granted {} to {}", to_string(capability), to_hex(identity));
}

void role_table_policy::revoke(const capability_t capability,
                               const account_id_t& identity) {
  auto lock = std::unique_lock{mutex_};
  auto it = grants_.find(capability);
  if (it != std::end(grants_)) {
    it->second.erase(identity);
  }
  spdlog::debug("Revoked {} from {}", to_string(capability), to_hex(identity));
}

}  // namespace launchpad::execution
