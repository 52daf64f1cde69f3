#pragma once
#include <launchpad/schema/pool_key.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(pool_key<1>&& o, ::scale::Encoder& encoder);
void decode(pool_key<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
