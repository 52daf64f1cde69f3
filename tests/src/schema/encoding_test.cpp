#include <gtest/gtest.h>
#include <launchpad/schema/encoding/scale/encoder.hpp>
#include <launchpad/testing/common.hpp>

#include <algorithm>
#include <limits>

using namespace launchpad::schema;
using launchpad::testing::make_hash;
using launchpad::testing::make_token_spec;

TEST(schema_encoding, creation_request_preserves_optional_fields) {
  auto request = creation_request_t{
      .id = 3,
      .requester = make_hash(1),
      .signers = {make_hash(2), make_hash(3)},
      .status = request_status_t::executed,
      .token = make_token_spec(),
      .created_token = make_hash(4),
      .created_pool = std::nullopt};

  auto codec = launchpad::scale_encoder_t{};
  auto decoded =
      codec.decode<creation_request_t>(make_bytes_view(codec.encode(request)));
  EXPECT_EQ(decoded.id, 3u);
  EXPECT_EQ(decoded.signers, request.signers);
  EXPECT_EQ(decoded.status, request_status_t::executed);
  EXPECT_EQ(decoded.token.name, request.token.name);
  EXPECT_EQ(decoded.token.max_supply, request.token.max_supply);
  EXPECT_EQ(decoded.created_token, request.created_token);
  EXPECT_FALSE(decoded.created_pool.has_value());
}

TEST(schema_encoding, large_amounts_survive_encoding) {
  auto grant = vesting_grant_t{
      .pool_id = make_hash(9),
      .token = make_hash(10),
      .beneficiary = make_hash(11),
      .amount = std::numeric_limits<amount_t>::max(),
      .start = 1700000000000ULL,
      .duration = 1000};
  auto codec = launchpad::scale_encoder_t{};
  auto decoded =
      codec.decode<vesting_grant_t>(make_bytes_view(codec.encode(grant)));
  EXPECT_EQ(decoded.amount, grant.amount);
  EXPECT_EQ(decoded.start, grant.start);
}

TEST(schema_encoding, transaction_keeps_payload_alternative) {
  auto tx = transaction_t{.version = 1,
                          .caller = make_hash(20),
                          .payload = unsign_request_t{.request_id = 12}};
  auto codec = launchpad::scale_encoder_t{};
  auto decoded = codec.decode<transaction_t>(make_bytes_view(codec.encode(tx)));
  ASSERT_TRUE(std::holds_alternative<unsign_request_t>(decoded.payload));
  EXPECT_EQ(std::get<unsign_request_t>(decoded.payload).request_id, 12u);
  EXPECT_EQ(decoded.caller, tx.caller);
}

TEST(schema_encoding, encode_overload_appends_exact_payload_bytes) {
  auto key = pool_key_t{.currency0 = make_hash(1),
                        .currency1 = make_hash(2),
                        .fee = 300,
                        .tick_spacing = 60,
                        .hooks = make_hash(3)};
  auto codec = launchpad::scale_encoder_t{};
  auto encoded = codec.encode(key);

  auto out = bytes_t{0xDE, 0xAD};
  codec.encode(key, out);
  ASSERT_EQ(out.size(), 2u + encoded.size());
  EXPECT_TRUE(std::equal(std::begin(encoded), std::end(encoded),
                         std::begin(out) + 2));
}

TEST(schema_encoding, try_decode_rejects_truncated_bytes) {
  auto tx = transaction_t{
      .version = 1,
      .caller = make_hash(30),
      .payload = submit_creation_request_t{.signers = {make_hash(31),
                                                       make_hash(32)},
                                           .token = make_token_spec()}};
  auto codec = launchpad::scale_encoder_t{};
  auto encoded = codec.encode(tx);
  encoded.resize(encoded.size() - 5);
  EXPECT_FALSE(codec.try_decode<transaction_t>(make_bytes_view(encoded))
                   .has_value());

  auto garbage = bytes_t{0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x01};
  EXPECT_FALSE(codec.try_decode<transaction_t>(make_bytes_view(garbage))
                   .has_value());
}
