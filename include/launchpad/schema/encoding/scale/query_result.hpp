#pragma once
#include <launchpad/schema/query_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(query_result<1>&& o, ::scale::Encoder& encoder);
void decode(query_result<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
