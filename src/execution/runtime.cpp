#include <spdlog/spdlog.h>
#include <launchpad/blake3/hash.hpp>
#include <launchpad/execution/runtime.hpp>

using namespace launchpad::schema;

namespace launchpad::execution {

runtime::runtime(const launchpad::config::settings& settings)
    : storage_{launchpad::storage::make_storage<
          launchpad::storage::rocksdb_storage_tag>(settings.db_path)},
      policy_{std::make_unique<role_table_policy>(settings.administrator)} {
  auto factory_identity = launchpad::blake3::hash(kFactoryIdentitySeed);
  auto coordinator_identity = launchpad::blake3::hash(kCoordinatorIdentitySeed);
  auto bootstrap_identity = launchpad::blake3::hash(kBootstrapIdentitySeed);

  policy_->grant(capability_t::open_signature_set, factory_identity);
  policy_->grant(capability_t::deploy_token, factory_identity);
  policy_->grant(capability_t::record_attestation, coordinator_identity);

  attestations_ = std::make_unique<launchpad::attestation::attestation_registry>(
      *policy_, storage_);
  tokens_ =
      std::make_unique<launchpad::token::token_registry>(*policy_, storage_);
  vesting_ = std::make_unique<launchpad::liquidity::vesting_registry>(storage_);
  pools_ = std::make_unique<launchpad::liquidity::pool_manager>(
      bootstrap_identity, storage_, *vesting_, settings.vesting);
  factory_ = std::make_unique<launchpad::factory::token_factory>(
      factory_identity, *policy_, storage_, *tokens_, *pools_);
  coordinator_ = std::make_unique<launchpad::coordinator::signer_coordinator>(
      coordinator_identity, *policy_, storage_, *factory_, *attestations_,
      settings.quorum);
  factory_->set_coordinator(settings.administrator, *coordinator_);
  engine_ = std::make_unique<execution::engine>(storage_, *factory_,
                                                *coordinator_, *attestations_,
                                                *tokens_, *pools_, *vesting_);
  spdlog::info("Runtime ready on {} (factory {}, coordinator {})",
               settings.db_path, to_hex(factory_identity),
               to_hex(coordinator_identity));
}

}  // namespace launchpad::execution
