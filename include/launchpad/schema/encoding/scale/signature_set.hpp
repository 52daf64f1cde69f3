#pragma once
#include <launchpad/schema/signature_set.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(collected_signature<1>&& o, ::scale::Encoder& encoder);
void decode(collected_signature<1>&& o, ::scale::Decoder& decoder);

void encode(signature_set<1>&& o, ::scale::Encoder& encoder);
void decode(signature_set<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
