#pragma once
#include <launchpad/schema/submit_creation_request.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(submit_creation_request<1>&& o, ::scale::Encoder& encoder);
void decode(submit_creation_request<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
