#include <launchpad/schema/key/builder.hpp>
#include <launchpad/schema/key/keys.hpp>

using namespace launchpad::schema;

namespace launchpad::schema::key {

bytes_t make_prefix(const std::string_view& prefix) {
  return builder{}.write(prefix).data;
}

bytes_t make_meta_key(const std::string_view& key) {
  return builder{}.write(key).data;
}

bytes_t make_request_key(const request_id_t id) {
  return builder{}.write(kRequestPrefix).write(id).data;
}

bytes_t make_signature_set_key(const request_id_t id) {
  return builder{}.write(kSignatureSetPrefix).write(id).data;
}

bytes_t make_attestation_key(const attestation_id_t id) {
  return builder{}.write(kAttestationPrefix).write(id).data;
}

bytes_t make_token_key(const address_t& address) {
  return builder{}.write(kTokenPrefix).write(address).data;
}

bytes_t make_pool_key(const pool_id_t& pool_id) {
  return builder{}.write(kPoolPrefix).write(pool_id).data;
}

bytes_t make_position_key(const pool_id_t& pool_id,
                          const account_id_t& provider) {
  return builder{}.write(kPositionPrefix).write(pool_id).write(provider).data;
}

bytes_t make_vesting_key(const pool_id_t& pool_id,
                         const account_id_t& beneficiary) {
  return builder{}.write(kVestingPrefix).write(pool_id).write(beneficiary).data;
}

}  // namespace launchpad::schema::key
