#pragma once
#include <launchpad/schema/add_liquidity.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(add_liquidity<1>&& o, ::scale::Encoder& encoder);
void decode(add_liquidity<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
