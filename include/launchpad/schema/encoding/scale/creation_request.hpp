#pragma once
#include <launchpad/schema/creation_request.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(creation_request<1>&& o, ::scale::Encoder& encoder);
void decode(creation_request<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
