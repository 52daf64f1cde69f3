#pragma once
#include <launchpad/schema/pool_key.hpp>
#include <launchpad/schema/primitives.hpp>

namespace launchpad::schema {

template <uint16_t Version>
struct pool_state;

template <>
struct pool_state<1> final {
  uint16_t version{1};
  pool_id_t id{};
  pool_key_t key;
  sqrt_price_x96_t sqrt_price_x96;
  amount_t total_liquidity;
  uint32_t vesting_grants{};
};

using pool_state_t = pool_state<1>;

}  // namespace launchpad::schema
