#pragma once
#include <launchpad/schema/primitives.hpp>

// Schema type: vesting grant.
// Launch workflow: reward schedule handed to an early liquidity provider.
// Release arithmetic belongs to the vesting wallet, not to this record.
namespace launchpad::schema {

template <uint16_t Version>
struct vesting_grant;

template <>
struct vesting_grant<1> final {
  uint16_t version{1};
  pool_id_t pool_id{};
  address_t token{};
  account_id_t beneficiary{};
  amount_t amount;
  timestamp_milliseconds_t start{};
  duration_milliseconds_t duration{};
};

using vesting_grant_t = vesting_grant<1>;

}  // namespace launchpad::schema
