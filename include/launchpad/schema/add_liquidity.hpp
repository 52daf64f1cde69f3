#pragma once
#include <launchpad/schema/primitives.hpp>

// Schema type: add liquidity.
// Transaction payload: the caller deposits liquidity into an initialized pool.
namespace launchpad::schema {

template <uint16_t Version>
struct add_liquidity;

template <>
struct add_liquidity<1> final {
  uint16_t version{1};
  pool_id_t pool_id{};
  amount_t amount;
  timestamp_milliseconds_t timestamp{};
};

using add_liquidity_t = add_liquidity<1>;

}  // namespace launchpad::schema
