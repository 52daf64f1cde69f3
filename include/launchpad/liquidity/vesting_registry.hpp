#pragma once

#include <launchpad/execution/journal.hpp>
#include <launchpad/schema/vesting_grant.hpp>
#include <launchpad/storage/rocksdb/storage.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace launchpad::liquidity {

/// Records the vesting schedules awarded to early liquidity providers.
class vesting_registry final {
 public:
  explicit vesting_registry(launchpad::storage::rocksdb_storage_t& storage);

  void grant(const launchpad::schema::vesting_grant_t& grant,
             launchpad::execution::journal& tx);

  std::optional<launchpad::schema::vesting_grant_t> get(
      const launchpad::schema::pool_id_t& pool_id,
      const launchpad::schema::account_id_t& beneficiary) const;

  std::vector<launchpad::schema::vesting_grant_t> grants_for(
      const launchpad::schema::pool_id_t& pool_id) const;

 private:
  using grant_key_t = std::pair<launchpad::schema::pool_id_t,
                                launchpad::schema::account_id_t>;

  void load_persisted_state();

  launchpad::storage::rocksdb_storage_t& storage_;
  mutable std::mutex mutex_;
  std::map<grant_key_t, launchpad::schema::vesting_grant_t> grants_;
};

}  // namespace launchpad::liquidity
