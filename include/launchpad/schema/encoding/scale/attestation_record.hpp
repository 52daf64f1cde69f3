#pragma once
#include <launchpad/schema/attestation_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(attestation_record<1>&& o, ::scale::Encoder& encoder);
void decode(attestation_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
