#pragma once
#include <launchpad/schema/retry_execution.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(retry_execution<1>&& o, ::scale::Encoder& encoder);
void decode(retry_execution<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
