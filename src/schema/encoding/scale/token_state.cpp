#include <launchpad/schema/encoding/scale/token_spec.hpp>
#include <launchpad/schema/encoding/scale/token_state.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(token_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.address, encoder);
  encode(o.owner, encoder);
  encode(o.spec, encoder);
  encode(o.minted, encoder);
}

void decode(token_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.address, decoder);
  decode(o.owner, decoder);
  decode(o.spec, decoder);
  decode(o.minted, decoder);
}

}  // namespace launchpad::schema::encoding::scale
