#pragma once
#include <launchpad/schema/liquidity_position.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(liquidity_position<1>&& o, ::scale::Encoder& encoder);
void decode(liquidity_position<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
