#include <launchpad/schema/encoding/scale/attestation_record.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(attestation_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.request_id, encoder);
  encode(o.signer, encoder);
  encode(o.status, encoder);
  encode(o.revoke_reason, encoder);
}

void decode(attestation_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.request_id, decoder);
  decode(o.signer, decoder);
  decode(o.status, decoder);
  decode(o.revoke_reason, decoder);
}

}  // namespace launchpad::schema::encoding::scale
