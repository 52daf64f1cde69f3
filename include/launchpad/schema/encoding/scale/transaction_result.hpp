#pragma once
#include <launchpad/schema/transaction_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(transaction_result<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_result<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
