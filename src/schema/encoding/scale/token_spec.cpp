#include <launchpad/schema/encoding/scale/token_spec.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(token_spec<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.symbol, encoder);
  encode(o.total_supply, encoder);
  encode(o.max_supply, encoder);
  encode(o.mintable, encoder);
  encode(o.burnable, encoder);
  encode(o.supply_capped, encoder);
}

void decode(token_spec<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.symbol, decoder);
  decode(o.total_supply, decoder);
  decode(o.max_supply, decoder);
  decode(o.mintable, decoder);
  decode(o.burnable, decoder);
  decode(o.supply_capped, decoder);
}

}  // namespace launchpad::schema::encoding::scale
