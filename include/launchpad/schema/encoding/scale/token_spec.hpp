#pragma once
#include <launchpad/schema/token_spec.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(token_spec<1>&& o, ::scale::Encoder& encoder);
void decode(token_spec<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
