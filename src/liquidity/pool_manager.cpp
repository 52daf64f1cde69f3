#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <launchpad/blake3/hash.hpp>
#include <launchpad/common/error.hpp>
#include <launchpad/liquidity/pool_manager.hpp>
#include <launchpad/schema/encoding/scale/encoder.hpp>
#include <launchpad/schema/key/builder.hpp>
#include <launchpad/schema/key/keys.hpp>
#include <algorithm>
#include <limits>

using namespace launchpad::schema;

namespace launchpad::liquidity {

const sqrt_price_x96_t kMinSqrtPriceX96{"4295128739"};
const sqrt_price_x96_t kMaxSqrtPriceX96{
    "1461446703485210103287273052203988822378723970342"};

namespace {

void validate_pool_key(const pool_key_t& key, const sqrt_price_x96_t& price) {
  if (key.currency0 == key.currency1) {
    launchpad::common::fail(transaction_error_code::invalid_pool_key,
                            "pool currencies must differ");
  }
  if (key.fee > kMaxPoolFee) {
    launchpad::common::fail(
        transaction_error_code::invalid_pool_key,
        fmt::format("fee {} exceeds {}", key.fee, kMaxPoolFee));
  }
  if (key.tick_spacing < kMinTickSpacing ||
      key.tick_spacing > kMaxTickSpacing) {
    launchpad::common::fail(
        transaction_error_code::invalid_pool_key,
        fmt::format("tick spacing {} outside [{}, {}]", key.tick_spacing,
                    kMinTickSpacing, kMaxTickSpacing));
  }
  if (price < kMinSqrtPriceX96 || price >= kMaxSqrtPriceX96) {
    launchpad::common::fail(
        transaction_error_code::invalid_pool_key,
        fmt::format("starting price {} out of range", to_string(price)));
  }
}

}  // namespace

pool_manager::pool_manager(const account_id_t& identity,
                           launchpad::storage::rocksdb_storage_t& storage,
                           vesting_registry& vesting,
                           vesting_policy policy)
    : identity_{identity},
      storage_{storage},
      vesting_{vesting},
      policy_{std::move(policy)} {
  load_persisted_state();
}

pool_id_t pool_manager::make_pool_id(const pool_key_t& key) {
  auto encoder = launchpad::scale_encoder_t{};
  auto encoded = encoder.encode(key);
  return launchpad::blake3::hash(make_bytes_view(encoded));
}

pool_id_t pool_manager::initialize_pool(const address_t& token_a,
                                        const address_t& token_b,
                                        const uint32_t fee,
                                        const int32_t tick_spacing,
                                        const sqrt_price_x96_t& starting_price,
                                        launchpad::execution::journal& tx) {
  auto key = pool_key_t{.currency0 = std::min(token_a, token_b),
                        .currency1 = std::max(token_a, token_b),
                        .fee = fee,
                        .tick_spacing = tick_spacing,
                        .hooks = identity_};
  validate_pool_key(key, starting_price);
  auto pool_id = make_pool_id(key);

  tx.hold(mutex_);
  if (pools_.contains(pool_id)) {
    launchpad::common::fail(
        transaction_error_code::pool_already_initialized,
        fmt::format("pool {} is already initialized", to_hex(pool_id)));
  }

  auto state = pool_state_t{.id = pool_id,
                            .key = key,
                            .sqrt_price_x96 = starting_price,
                            .total_liquidity = 0,
                            .vesting_grants = 0};
  pools_.emplace(pool_id, state);
  tx.on_rollback([this, pool_id] { pools_.erase(pool_id); });

  tx.put(key::make_pool_key(pool_id), state);
  tx.emit("pool_initialized",
          {{"pool_id", to_hex(pool_id)},
           {"currency0", to_hex(key.currency0)},
           {"currency1", to_hex(key.currency1)},
           {"fee", std::to_string(fee)},
           {"tick_spacing", std::to_string(tick_spacing)},
           {"sqrt_price_x96", to_string(starting_price)}});
  return pool_id;
}

void pool_manager::add_liquidity(const account_id_t& provider,
                                 const pool_id_t& pool_id,
                                 const amount_t& amount,
                                 const timestamp_milliseconds_t timestamp,
                                 launchpad::execution::journal& tx) {
  if (amount == 0) {
    launchpad::common::fail(transaction_error_code::invalid_liquidity,
                            "liquidity amount must be positive");
  }
  tx.hold(mutex_);
  auto pool_it = pools_.find(pool_id);
  if (pool_it == std::end(pools_)) {
    launchpad::common::fail(
        transaction_error_code::pool_not_initialized,
        fmt::format("pool {} is not initialized", to_hex(pool_id)));
  }
  auto& pool = pool_it->second;
  auto position_key = position_key_t{pool_id, provider};
  auto existing = positions_.find(position_key);
  auto held = existing == std::end(positions_) ? amount_t{0}
                                               : existing->second.liquidity;
  const auto max_amount = std::numeric_limits<amount_t>::max();
  if (max_amount - held < amount ||
      max_amount - pool.total_liquidity < amount) {
    launchpad::common::fail(transaction_error_code::invalid_liquidity,
                            "liquidity overflows position");
  }

  auto previous_pool = pool;
  auto previous_position = std::optional<liquidity_position_t>{};
  if (existing != std::end(positions_)) {
    previous_position = existing->second;
  }
  tx.on_rollback([this, previous_pool, previous_position, position_key] {
    pools_[previous_pool.id] = previous_pool;
    if (previous_position) {
      positions_[position_key] = *previous_position;
    } else {
      positions_.erase(position_key);
    }
  });

  auto& position =
      positions_
          .try_emplace(position_key,
                       liquidity_position_t{.pool_id = pool_id,
                                            .provider = provider})
          .first->second;
  position.liquidity += amount;
  pool.total_liquidity += amount;
  tx.emit("liquidity_added", {{"pool_id", to_hex(pool_id)},
                              {"provider", to_hex(provider)},
                              {"amount", to_string(amount)},
                              {"position", to_string(position.liquidity)}});

  if (!position.vesting_granted &&
      position.liquidity >= policy_.liquidity_threshold &&
      pool.vesting_grants < policy_.max_grants_per_pool) {
    // Reward is paid in currency1; the native reference currency sorts first.
    vesting_.grant(vesting_grant_t{.pool_id = pool_id,
                                   .token = pool.key.currency1,
                                   .beneficiary = provider,
                                   .amount = policy_.grant_amount,
                                   .start = timestamp,
                                   .duration = policy_.grant_duration},
                   tx);
    position.vesting_granted = true;
    ++pool.vesting_grants;
  }

  tx.put(key::make_pool_key(pool_id), pool);
  tx.put(key::make_position_key(pool_id, provider), position);
}

void pool_manager::add_liquidity(const account_id_t& provider,
                                 const pool_id_t& pool_id,
                                 const amount_t& amount,
                                 const timestamp_milliseconds_t timestamp) {
  auto tx = launchpad::execution::journal{storage_};
  add_liquidity(provider, pool_id, amount, timestamp, tx);
  tx.commit();
}

std::optional<pool_state_t> pool_manager::get_pool(
    const pool_id_t& pool_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = pools_.find(pool_id);
  if (it == std::end(pools_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<liquidity_position_t> pool_manager::get_position(
    const pool_id_t& pool_id,
    const account_id_t& provider) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = positions_.find(position_key_t{pool_id, provider});
  if (it == std::end(positions_)) {
    return std::nullopt;
  }
  return it->second;
}

void pool_manager::load_persisted_state() {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = launchpad::scale_encoder_t{};
  auto pool_prefix = key::make_prefix(key::kPoolPrefix);
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(pool_prefix))) {
    auto state = encoder.decode<pool_state_t>(make_bytes_view(value));
    pools_.emplace(state.id, std::move(state));
  }
  auto position_prefix = key::make_prefix(key::kPositionPrefix);
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(position_prefix))) {
    auto position = encoder.decode<liquidity_position_t>(make_bytes_view(value));
    auto position_key = position_key_t{position.pool_id, position.provider};
    positions_.emplace(position_key, std::move(position));
  }
  spdlog::debug("Loaded {} pool(s) and {} position(s)", pools_.size(),
                positions_.size());
}

}  // namespace launchpad::liquidity
