#pragma once
#include <launchpad/schema/transaction_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(transaction_event_attribute<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_event_attribute<1>&& o, ::scale::Decoder& decoder);

void encode(transaction_event<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_event<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
