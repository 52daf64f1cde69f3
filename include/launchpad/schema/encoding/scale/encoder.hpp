#pragma once
#include <launchpad/common/critical.hpp>
#include <launchpad/schema/encoding/encoder.hpp>
#include <launchpad/schema/encoding/scale/add_liquidity.hpp>
#include <launchpad/schema/encoding/scale/attestation_record.hpp>
#include <launchpad/schema/encoding/scale/creation_request.hpp>
#include <launchpad/schema/encoding/scale/engine_info.hpp>
#include <launchpad/schema/encoding/scale/liquidity_position.hpp>
#include <launchpad/schema/encoding/scale/pool_key.hpp>
#include <launchpad/schema/encoding/scale/pool_state.hpp>
#include <launchpad/schema/encoding/scale/query_result.hpp>
#include <launchpad/schema/encoding/scale/retry_execution.hpp>
#include <launchpad/schema/encoding/scale/sign_request.hpp>
#include <launchpad/schema/encoding/scale/signature_set.hpp>
#include <launchpad/schema/encoding/scale/submit_creation_request.hpp>
#include <launchpad/schema/encoding/scale/token_spec.hpp>
#include <launchpad/schema/encoding/scale/token_state.hpp>
#include <launchpad/schema/encoding/scale/transaction.hpp>
#include <launchpad/schema/encoding/scale/transaction_event.hpp>
#include <launchpad/schema/encoding/scale/transaction_result.hpp>
#include <launchpad/schema/encoding/scale/unsign_request.hpp>
#include <launchpad/schema/encoding/scale/vesting_grant.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace launchpad::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  launchpad::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, launchpad::schema::bytes_t& out);

  template <typename T>
  T decode(const launchpad::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const launchpad::schema::bytes_view_t& bytes);
};

template <typename T>
launchpad::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    launchpad::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        launchpad::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

/// Decoding untrusted bytes must go through try_decode; decode is for rows
/// this process wrote itself.
template <typename T>
T encoder<scale_encoder_tag>::decode(
    const launchpad::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    launchpad::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const launchpad::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace launchpad::schema::encoding

namespace launchpad {

using scale_encoder_t = schema::encoding::encoder<schema::encoding::scale_encoder_tag>;

}  // namespace launchpad
