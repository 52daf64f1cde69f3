#pragma once
#include <launchpad/schema/primitives.hpp>

// Schema type: liquidity position.
// Launch workflow: cumulative liquidity a provider added to one pool.
namespace launchpad::schema {

template <uint16_t Version>
struct liquidity_position;

template <>
struct liquidity_position<1> final {
  uint16_t version{1};
  pool_id_t pool_id{};
  account_id_t provider{};
  amount_t liquidity;
  bool vesting_granted{};
};

using liquidity_position_t = liquidity_position<1>;

}  // namespace launchpad::schema
