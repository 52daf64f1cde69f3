#include <launchpad/schema/encoding/scale/liquidity_position.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(liquidity_position<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.pool_id, encoder);
  encode(o.provider, encoder);
  encode(o.liquidity, encoder);
  encode(o.vesting_granted, encoder);
}

void decode(liquidity_position<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.pool_id, decoder);
  decode(o.provider, decoder);
  decode(o.liquidity, decoder);
  decode(o.vesting_granted, decoder);
}

}  // namespace launchpad::schema::encoding::scale
