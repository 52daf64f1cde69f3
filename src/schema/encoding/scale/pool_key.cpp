#include <launchpad/schema/encoding/scale/pool_key.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(pool_key<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.currency0, encoder);
  encode(o.currency1, encoder);
  encode(o.fee, encoder);
  encode(o.tick_spacing, encoder);
  encode(o.hooks, encoder);
}

void decode(pool_key<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.currency0, decoder);
  decode(o.currency1, decoder);
  decode(o.fee, decoder);
  decode(o.tick_spacing, decoder);
  decode(o.hooks, decoder);
}

}  // namespace launchpad::schema::encoding::scale
