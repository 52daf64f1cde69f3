#pragma once
#include <launchpad/schema/engine_info.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(engine_info<1>&& o, ::scale::Encoder& encoder);
void decode(engine_info<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
