#include <launchpad/schema/encoding/scale/engine_info.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(engine_info<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.request_count, encoder);
  encode(o.applied_transactions, encoder);
  encode(o.rejected_transactions, encoder);
  encode(o.quorum_rule, encoder);
}

void decode(engine_info<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.request_count, decoder);
  decode(o.applied_transactions, decoder);
  decode(o.rejected_transactions, decoder);
  decode(o.quorum_rule, decoder);
}

}  // namespace launchpad::schema::encoding::scale
