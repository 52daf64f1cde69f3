#pragma once

#include <launchpad/execution/authorization_policy.hpp>
#include <launchpad/schema/token_state.hpp>
#include <launchpad/storage/rocksdb/storage.hpp>
#include <launchpad/token/token_deployer.hpp>

#include <map>
#include <mutex>
#include <optional>

namespace launchpad::token {

/// Ledger of deployed tokens. The whole initial supply is minted to the
/// owner at deployment.
class token_registry final : public token_deployer {
 public:
  token_registry(launchpad::execution::authorization_policy& policy,
                 launchpad::storage::rocksdb_storage_t& storage);

  launchpad::schema::address_t deploy(
      const launchpad::schema::account_id_t& caller,
      const launchpad::schema::token_spec_t& spec,
      const launchpad::schema::account_id_t& owner,
      launchpad::execution::journal& tx) override;

  std::optional<launchpad::schema::token_state_t> get(
      const launchpad::schema::address_t& address) const;

  size_t size() const;

 private:
  void load_persisted_state();

  launchpad::execution::authorization_policy& policy_;
  launchpad::storage::rocksdb_storage_t& storage_;
  mutable std::mutex mutex_;
  uint64_t nonce_{};
  std::map<launchpad::schema::address_t, launchpad::schema::token_state_t>
      tokens_;
};

}  // namespace launchpad::token
