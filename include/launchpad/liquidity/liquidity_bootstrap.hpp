#pragma once

#include <launchpad/execution/journal.hpp>
#include <launchpad/schema/primitives.hpp>

namespace launchpad::liquidity {

/// Pool initializer the factory hands each new token to.
class liquidity_bootstrap {
 public:
  virtual ~liquidity_bootstrap() = default;

  /// Identity recorded as the hooks address of every pool this bootstrap
  /// initializes.
  virtual const launchpad::schema::account_id_t& identity() const = 0;

  /// Create a pool for the pair, sorted by address, at the starting price.
  virtual launchpad::schema::pool_id_t initialize_pool(
      const launchpad::schema::address_t& token_a,
      const launchpad::schema::address_t& token_b,
      uint32_t fee,
      int32_t tick_spacing,
      const launchpad::schema::sqrt_price_x96_t& starting_price,
      launchpad::execution::journal& tx) = 0;
};

}  // namespace launchpad::liquidity
