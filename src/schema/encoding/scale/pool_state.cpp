#include <launchpad/schema/encoding/scale/pool_key.hpp>
#include <launchpad/schema/encoding/scale/pool_state.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(pool_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.key, encoder);
  encode(o.sqrt_price_x96, encoder);
  encode(o.total_liquidity, encoder);
  encode(o.vesting_grants, encoder);
}

void decode(pool_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.key, decoder);
  decode(o.sqrt_price_x96, decoder);
  decode(o.total_liquidity, decoder);
  decode(o.vesting_grants, decoder);
}

}  // namespace launchpad::schema::encoding::scale
