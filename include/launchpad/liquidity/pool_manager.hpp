#pragma once

#include <launchpad/liquidity/liquidity_bootstrap.hpp>
#include <launchpad/liquidity/vesting_registry.hpp>
#include <launchpad/schema/liquidity_position.hpp>
#include <launchpad/schema/pool_key.hpp>
#include <launchpad/schema/pool_state.hpp>
#include <launchpad/storage/rocksdb/storage.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <utility>

namespace launchpad::liquidity {

/// Bounds of a valid starting price, as sqrt(price) in Q64.96.
extern const launchpad::schema::sqrt_price_x96_t kMinSqrtPriceX96;
extern const launchpad::schema::sqrt_price_x96_t kMaxSqrtPriceX96;

inline constexpr auto kMaxPoolFee = uint32_t{1'000'000};
inline constexpr auto kMinTickSpacing = int32_t{1};
inline constexpr auto kMaxTickSpacing = int32_t{32'767};

struct vesting_policy final {
  /// Cumulative liquidity a provider must reach to earn a grant.
  launchpad::schema::amount_t liquidity_threshold{1'000'000};
  launchpad::schema::amount_t grant_amount{100'000};
  launchpad::schema::duration_milliseconds_t grant_duration{
      30ull * 24 * 60 * 60 * 1000};
  /// Grants per pool; providers past this count receive none.
  uint32_t max_grants_per_pool{10};
};

/// Pool ledger and vesting hook for early liquidity providers.
class pool_manager final : public liquidity_bootstrap {
 public:
  pool_manager(const launchpad::schema::account_id_t& identity,
               launchpad::storage::rocksdb_storage_t& storage,
               vesting_registry& vesting,
               vesting_policy policy);

  const launchpad::schema::account_id_t& identity() const override {
    return identity_;
  }

  launchpad::schema::pool_id_t initialize_pool(
      const launchpad::schema::address_t& token_a,
      const launchpad::schema::address_t& token_b,
      uint32_t fee,
      int32_t tick_spacing,
      const launchpad::schema::sqrt_price_x96_t& starting_price,
      launchpad::execution::journal& tx) override;

  /// Credit `amount` of liquidity to `provider`, awarding a vesting grant
  /// the first time their cumulative position reaches the threshold.
  void add_liquidity(const launchpad::schema::account_id_t& provider,
                     const launchpad::schema::pool_id_t& pool_id,
                     const launchpad::schema::amount_t& amount,
                     launchpad::schema::timestamp_milliseconds_t timestamp,
                     launchpad::execution::journal& tx);
  void add_liquidity(const launchpad::schema::account_id_t& provider,
                     const launchpad::schema::pool_id_t& pool_id,
                     const launchpad::schema::amount_t& amount,
                     launchpad::schema::timestamp_milliseconds_t timestamp);

  std::optional<launchpad::schema::pool_state_t> get_pool(
      const launchpad::schema::pool_id_t& pool_id) const;
  std::optional<launchpad::schema::liquidity_position_t> get_position(
      const launchpad::schema::pool_id_t& pool_id,
      const launchpad::schema::account_id_t& provider) const;

  const vesting_policy& policy() const { return policy_; }

  static launchpad::schema::pool_id_t make_pool_id(
      const launchpad::schema::pool_key_t& key);

 private:
  using position_key_t = std::pair<launchpad::schema::pool_id_t,
                                   launchpad::schema::account_id_t>;

  void load_persisted_state();

  launchpad::schema::account_id_t identity_;
  launchpad::storage::rocksdb_storage_t& storage_;
  vesting_registry& vesting_;
  vesting_policy policy_;
  mutable std::mutex mutex_;
  std::map<launchpad::schema::pool_id_t, launchpad::schema::pool_state_t>
      pools_;
  std::map<position_key_t, launchpad::schema::liquidity_position_t>
      positions_;
};

}  // namespace launchpad::liquidity
