#pragma once
#include <launchpad/schema/pool_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(pool_state<1>&& o, ::scale::Encoder& encoder);
void decode(pool_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
