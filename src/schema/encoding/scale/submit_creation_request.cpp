#include <launchpad/schema/encoding/scale/submit_creation_request.hpp>
#include <launchpad/schema/encoding/scale/token_spec.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(submit_creation_request<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.signers, encoder);
  encode(o.token, encoder);
}

void decode(submit_creation_request<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.signers, decoder);
  decode(o.token, decoder);
}

}  // namespace launchpad::schema::encoding::scale
