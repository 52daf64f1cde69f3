#include <launchpad/schema/encoding/scale/add_liquidity.hpp>
#include <launchpad/schema/encoding/scale/retry_execution.hpp>
#include <launchpad/schema/encoding/scale/sign_request.hpp>
#include <launchpad/schema/encoding/scale/submit_creation_request.hpp>
#include <launchpad/schema/encoding/scale/transaction.hpp>
#include <launchpad/schema/encoding/scale/unsign_request.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.caller, encoder);
  encode(o.payload, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.caller, decoder);
  decode(o.payload, decoder);
}

}  // namespace launchpad::schema::encoding::scale
