#pragma once
#include <launchpad/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder);
void decode(transaction<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
