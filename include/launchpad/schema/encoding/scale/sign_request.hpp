#pragma once
#include <launchpad/schema/sign_request.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(sign_request<1>&& o, ::scale::Encoder& encoder);
void decode(sign_request<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
