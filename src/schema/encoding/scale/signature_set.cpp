#include <launchpad/schema/encoding/scale/signature_set.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(collected_signature<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.signer, encoder);
  encode(o.attestation_id, encoder);
}

void decode(collected_signature<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.signer, decoder);
  decode(o.attestation_id, decoder);
}

void encode(signature_set<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.request_id, encoder);
  encode(o.requester, encoder);
  encode(o.status, encoder);
  encode(o.quorum_rule, encoder);
  encode(o.eligible_signers, encoder);
  encode(o.collected_signatures, encoder);
}

void decode(signature_set<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.request_id, decoder);
  decode(o.requester, decoder);
  decode(o.status, decoder);
  decode(o.quorum_rule, decoder);
  decode(o.eligible_signers, decoder);
  decode(o.collected_signatures, decoder);
}

}  // namespace launchpad::schema::encoding::scale
