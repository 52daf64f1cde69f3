#pragma once

#include <launchpad/attestation/attestation_registry.hpp>
#include <launchpad/config/settings.hpp>
#include <launchpad/coordinator/signer_coordinator.hpp>
#include <launchpad/execution/authorization_policy.hpp>
#include <launchpad/execution/engine.hpp>
#include <launchpad/factory/token_factory.hpp>
#include <launchpad/liquidity/pool_manager.hpp>
#include <launchpad/liquidity/vesting_registry.hpp>
#include <launchpad/storage/rocksdb/storage.hpp>
#include <launchpad/token/token_registry.hpp>

#include <memory>
#include <string_view>

namespace launchpad::execution {

inline constexpr auto kFactoryIdentitySeed =
    std::string_view{"launchpad/factory"};
inline constexpr auto kCoordinatorIdentitySeed =
    std::string_view{"launchpad/coordinator"};
inline constexpr auto kBootstrapIdentitySeed =
    std::string_view{"launchpad/liquidity-bootstrap"};

/// Owns storage and every component, wired in dependency order.
class runtime final {
 public:
  explicit runtime(const launchpad::config::settings& settings);

  runtime(const runtime&) = delete;
  runtime& operator=(const runtime&) = delete;

  launchpad::storage::rocksdb_storage_t& storage() { return storage_; }
  authorization_policy& policy() { return *policy_; }
  launchpad::attestation::attestation_registry& attestations() {
    return *attestations_;
  }
  launchpad::token::token_registry& tokens() { return *tokens_; }
  launchpad::liquidity::vesting_registry& vesting() { return *vesting_; }
  launchpad::liquidity::pool_manager& pools() { return *pools_; }
  launchpad::factory::token_factory& factory() { return *factory_; }
  launchpad::coordinator::signer_coordinator& coordinator() {
    return *coordinator_;
  }
  execution::engine& engine() { return *engine_; }

 private:
  launchpad::storage::rocksdb_storage_t storage_;
  std::unique_ptr<authorization_policy> policy_;
  std::unique_ptr<launchpad::attestation::attestation_registry> attestations_;
  std::unique_ptr<launchpad::token::token_registry> tokens_;
  std::unique_ptr<launchpad::liquidity::vesting_registry> vesting_;
  std::unique_ptr<launchpad::liquidity::pool_manager> pools_;
  std::unique_ptr<launchpad::factory::token_factory> factory_;
  std::unique_ptr<launchpad::coordinator::signer_coordinator> coordinator_;
  std::unique_ptr<execution::engine> engine_;
};

}  // namespace launchpad::execution
