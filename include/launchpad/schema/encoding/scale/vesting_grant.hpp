#pragma once
#include <launchpad/schema/vesting_grant.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace launchpad::schema::encoding::scale {

void encode(vesting_grant<1>&& o, ::scale::Encoder& encoder);
void decode(vesting_grant<1>&& o, ::scale::Decoder& decoder);

}  // namespace launchpad::schema::encoding::scale
