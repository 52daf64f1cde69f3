#include <launchpad/schema/encoding/scale/vesting_grant.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(vesting_grant<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.pool_id, encoder);
  encode(o.token, encoder);
  encode(o.beneficiary, encoder);
  encode(o.amount, encoder);
  encode(o.start, encoder);
  encode(o.duration, encoder);
}

void decode(vesting_grant<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.pool_id, decoder);
  decode(o.token, decoder);
  decode(o.beneficiary, decoder);
  decode(o.amount, decoder);
  decode(o.start, decoder);
  decode(o.duration, decoder);
}

}  // namespace launchpad::schema::encoding::scale
