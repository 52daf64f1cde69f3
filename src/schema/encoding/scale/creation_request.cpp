#include <launchpad/schema/encoding/scale/creation_request.hpp>
#include <launchpad/schema/encoding/scale/token_spec.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(creation_request<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.requester, encoder);
  encode(o.signers, encoder);
  encode(o.status, encoder);
  encode(o.token, encoder);
  encode(o.created_token, encoder);
  encode(o.created_pool, encoder);
}

void decode(creation_request<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.requester, decoder);
  decode(o.signers, decoder);
  decode(o.status, decoder);
  decode(o.token, decoder);
  decode(o.created_token, decoder);
  decode(o.created_pool, decoder);
}

}  // namespace launchpad::schema::encoding::scale
