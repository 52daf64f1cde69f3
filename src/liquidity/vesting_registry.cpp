#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <launchpad/common/error.hpp>
#include <launchpad/liquidity/vesting_registry.hpp>
#include <launchpad/schema/encoding/scale/encoder.hpp>
#include <launchpad/schema/key/keys.hpp>

using namespace launchpad::schema;

namespace launchpad::liquidity {

vesting_registry::vesting_registry(
    launchpad::storage::rocksdb_storage_t& storage)
    : storage_{storage} {
  load_persisted_state();
}

void vesting_registry::grant(const vesting_grant_t& grant,
                             launchpad::execution::journal& tx) {
  tx.hold(mutex_);
  auto grant_key = grant_key_t{grant.pool_id, grant.beneficiary};
  if (grants_.contains(grant_key)) {
    launchpad::common::fail(
        transaction_error_code::integration_failure,
        fmt::format("{} already holds a vesting grant for pool {}",
                    to_hex(grant.beneficiary), to_hex(grant.pool_id)));
  }
  grants_.emplace(grant_key, grant);
  tx.on_rollback([this, grant_key] { grants_.erase(grant_key); });

  tx.put(key::make_vesting_key(grant.pool_id, grant.beneficiary), grant);
  tx.emit("vesting_granted", {{"pool_id", to_hex(grant.pool_id)},
                              {"beneficiary", to_hex(grant.beneficiary)},
                              {"token", to_hex(grant.token)},
                              {"amount", to_string(grant.amount)},
                              {"start", std::to_string(grant.start)},
                              {"duration", std::to_string(grant.duration)}});
}

std::optional<vesting_grant_t> vesting_registry::get(
    const pool_id_t& pool_id,
    const account_id_t& beneficiary) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = grants_.find(grant_key_t{pool_id, beneficiary});
  if (it == std::end(grants_)) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<vesting_grant_t> vesting_registry::grants_for(
    const pool_id_t& pool_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = std::vector<vesting_grant_t>{};
  for (auto it = grants_.lower_bound(grant_key_t{pool_id, account_id_t{}});
       it != std::end(grants_) && it->first.first == pool_id; ++it) {
    result.push_back(it->second);
  }
  return result;
}

void vesting_registry::load_persisted_state() {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = launchpad::scale_encoder_t{};
  auto prefix = key::make_prefix(key::kVestingPrefix);
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto grant = encoder.decode<vesting_grant_t>(make_bytes_view(value));
    auto grant_key = grant_key_t{grant.pool_id, grant.beneficiary};
    grants_.emplace(grant_key, std::move(grant));
  }
  spdlog::debug("Loaded {} vesting grant(s)", grants_.size());
}

}  // namespace launchpad::liquidity
