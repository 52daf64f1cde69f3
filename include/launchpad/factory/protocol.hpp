#pragma once

#include <launchpad/schema/primitives.hpp>

namespace launchpad::factory {

// Pool parameters every created memecoin is paired with.
inline constexpr auto kPoolFee = uint32_t{300};
inline constexpr auto kPoolTickSpacing = int32_t{60};

/// 1:1 starting price, 2^96 in Q64.96.
inline const launchpad::schema::sqrt_price_x96_t kStartingSqrtPriceX96 =
    launchpad::schema::sqrt_price_x96_t{1} << 96;

/// Native currency each token is paired against.
inline const auto kReferenceCurrency = launchpad::schema::address_t{};

}  // namespace launchpad::factory
