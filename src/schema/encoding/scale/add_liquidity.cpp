#include <launchpad/schema/encoding/scale/add_liquidity.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(add_liquidity<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.pool_id, encoder);
  encode(o.amount, encoder);
  encode(o.timestamp, encoder);
}

void decode(add_liquidity<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.pool_id, decoder);
  decode(o.amount, decoder);
  decode(o.timestamp, decoder);
}

}  // namespace launchpad::schema::encoding::scale
