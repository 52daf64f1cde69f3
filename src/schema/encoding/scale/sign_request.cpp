#include <launchpad/schema/encoding/scale/sign_request.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(sign_request<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.request_id, encoder);
}

void decode(sign_request<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.request_id, decoder);
}

}  // namespace launchpad::schema::encoding::scale
