#pragma once
#include <launchpad/schema/primitives.hpp>

// Schema type: pool key.
// Launch workflow: identifies a liquidity pool; currency0 sorts strictly
// before currency1.
namespace launchpad::schema {

template <uint16_t Version>
struct pool_key;

template <>
struct pool_key<1> final {
  uint16_t version{1};
  address_t currency0{};
  address_t currency1{};
  uint32_t fee{};
  int32_t tick_spacing{};
  account_id_t hooks{};
};

using pool_key_t = pool_key<1>;

}  // namespace launchpad::schema
