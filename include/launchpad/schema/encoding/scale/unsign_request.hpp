#pragma once
#include <launchpad/schema/unsign_request.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(unsign_request<1>&& o, ::scale::Encoder& encoder);
void decode(unsign_request<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
