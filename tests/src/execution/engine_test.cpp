#include <gtest/gtest.h>
#include <launchpad/execution/engine.hpp>
#include <launchpad/schema/encoding/scale/encoder.hpp>
#include <launchpad/schema/engine_info.hpp>
#include <launchpad/testing/runtime_fixture.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace launchpad::schema;
using launchpad::testing::make_token_spec;

namespace {

class engine_test : public launchpad::testing::runtime_fixture {
 protected:
  transaction_result_t apply(const account_id_t& caller,
                             const transaction_payload_t& payload) {
    auto encoded = encoder_.encode(
        transaction_t{.version = 1, .caller = caller, .payload = payload});
    return runtime().engine().apply(make_bytes_view(encoded));
  }

  request_id_t submit_via_engine(const std::vector<account_id_t>& signers) {
    auto result = apply(requester, submit_creation_request_t{
                                       .signers = signers,
                                       .token = make_token_spec()});
    EXPECT_EQ(result.code, 0u) << result.log;
    return encoder_.decode<request_id_t>(make_bytes_view(result.data));
  }

  query_result_t query_id(const std::string_view path, const uint64_t id) {
    auto key = encoder_.encode(id);
    return runtime().engine().query(path, make_bytes_view(key));
  }

  static bool has_event(const transaction_result_t& result,
                        const std::string_view type) {
    return std::ranges::any_of(result.events, [&](const auto& event) {
      return event.type == type;
    });
  }

  launchpad::scale_encoder_t encoder_{};
};

}  // namespace

TEST_F(engine_test, submit_returns_id_and_queued_event) {
  auto result = apply(requester, submit_creation_request_t{
                                     .signers = {alice, bob, carol},
                                     .token = make_token_spec()});
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(result.codespace, "launchpad.apply");
  EXPECT_EQ(encoder_.decode<request_id_t>(make_bytes_view(result.data)), 1u);
  EXPECT_TRUE(has_event(result, "request_queued"));
}

TEST_F(engine_test, full_flow_through_transactions) {
  auto id = submit_via_engine({alice, bob, carol});

  auto first = apply(alice, sign_request_t{.request_id = id});
  ASSERT_EQ(first.code, 0u) << first.log;
  EXPECT_TRUE(has_event(first, "request_signed"));
  EXPECT_TRUE(has_event(first, "attestation_recorded"));

  auto second = apply(bob, sign_request_t{.request_id = id});
  ASSERT_EQ(second.code, 0u) << second.log;
  EXPECT_TRUE(has_event(second, "token_deployed"));
  EXPECT_TRUE(has_event(second, "pool_initialized"));
  EXPECT_TRUE(has_event(second, "memecoin_created"));
  EXPECT_TRUE(has_event(second, "quorum_reached"));

  auto third = apply(carol, sign_request_t{.request_id = id});
  EXPECT_EQ(third.code, static_cast<uint32_t>(
                            transaction_error_code::transaction_already_executed));
  EXPECT_EQ(third.info, "state_conflict");
  EXPECT_TRUE(third.events.empty());

  auto request = query_id("/request", id);
  ASSERT_EQ(request.code, 0u);
  auto record =
      encoder_.decode<creation_request_t>(make_bytes_view(request.value));
  EXPECT_EQ(record.status, request_status_t::executed);
  ASSERT_TRUE(record.created_pool.has_value());

  auto pool = runtime().engine().query(
      "/pool", bytes_view_t{record.created_pool->data(),
                            record.created_pool->size()});
  ASSERT_EQ(pool.code, 0u);
  auto state = encoder_.decode<pool_state_t>(make_bytes_view(pool.value));
  EXPECT_EQ(state.key.fee, 300u);

  auto liquidity = apply(dave, add_liquidity_t{.pool_id = *record.created_pool,
                                               .amount = 1'000,
                                               .timestamp = 5});
  ASSERT_EQ(liquidity.code, 0u) << liquidity.log;
  EXPECT_TRUE(has_event(liquidity, "vesting_granted"));
}

TEST_F(engine_test, rejected_transaction_reports_code_and_category) {
  auto id = submit_via_engine({alice, bob, carol});
  auto result = apply(dave, sign_request_t{.request_id = id});
  EXPECT_EQ(result.code,
            static_cast<uint32_t>(transaction_error_code::not_a_signer));
  EXPECT_EQ(result.info, "authorization");
  EXPECT_FALSE(result.log.empty());

  auto invalid = apply(requester, submit_creation_request_t{
                                      .signers = {alice},
                                      .token = make_token_spec()});
  EXPECT_EQ(invalid.code, static_cast<uint32_t>(
                              transaction_error_code::invalid_signer_count));
  EXPECT_EQ(invalid.info, "validation");
}

TEST_F(engine_test, undecodable_and_wrong_version_transactions) {
  auto garbage = bytes_t{0xff, 0x01};
  auto result = runtime().engine().apply(make_bytes_view(garbage));
  EXPECT_EQ(result.code,
            static_cast<uint32_t>(transaction_error_code::invalid_transaction));

  auto encoded = encoder_.encode(transaction_t{
      .version = 2, .caller = alice, .payload = sign_request_t{.request_id = 1}});
  auto versioned = runtime().engine().apply(make_bytes_view(encoded));
  EXPECT_EQ(versioned.code,
            static_cast<uint32_t>(
                transaction_error_code::unsupported_transaction_version));
}

TEST_F(engine_test, check_validates_shape_without_state_change) {
  auto bad = encoder_.encode(transaction_t{
      .version = 1,
      .caller = requester,
      .payload = submit_creation_request_t{.signers = {alice, bob},
                                           .token = make_token_spec("", "X")}});
  auto result = runtime().engine().check(make_bytes_view(bad));
  EXPECT_EQ(result.code,
            static_cast<uint32_t>(transaction_error_code::empty_name));
  EXPECT_EQ(result.codespace, "launchpad.check");

  auto good = encoder_.encode(transaction_t{
      .version = 1,
      .caller = requester,
      .payload = submit_creation_request_t{.signers = {alice, bob},
                                           .token = make_token_spec()}});
  EXPECT_EQ(runtime().engine().check(make_bytes_view(good)).code, 0u);
  EXPECT_EQ(runtime().factory().request_count(), 0u);
}

TEST_F(engine_test, query_errors) {
  auto missing = query_id("/request", 5);
  EXPECT_EQ(missing.code, static_cast<uint32_t>(query_error_code::not_found));

  auto short_key = bytes_t{0x01};
  auto invalid = runtime().engine().query("/token", make_bytes_view(short_key));
  EXPECT_EQ(invalid.code, static_cast<uint32_t>(query_error_code::invalid_key));

  auto unknown = runtime().engine().query("/nope", {});
  EXPECT_EQ(unknown.code,
            static_cast<uint32_t>(query_error_code::unsupported_path));
}

TEST_F(engine_test, engine_info_counts_transactions) {
  auto id = submit_via_engine({alice, bob, carol});
  apply(dave, sign_request_t{.request_id = id});

  auto info_result = runtime().engine().query("/engine/info", {});
  ASSERT_EQ(info_result.code, 0u);
  auto info =
      encoder_.decode<engine_info_t>(make_bytes_view(info_result.value));
  EXPECT_EQ(info.request_count, 1u);
  EXPECT_EQ(info.applied_transactions, 1u);
  EXPECT_EQ(info.rejected_transactions, 1u);
  EXPECT_EQ(info.quorum_rule, "all-but-one");
}

TEST_F(engine_test, signature_and_attestation_queries) {
  auto id = submit_via_engine({alice, bob, carol});
  apply(alice, sign_request_t{.request_id = id});

  auto signatures = query_id("/signatures", id);
  ASSERT_EQ(signatures.code, 0u);
  auto set =
      encoder_.decode<signature_set_t>(make_bytes_view(signatures.value));
  ASSERT_EQ(set.collected_signatures.size(), 1u);
  EXPECT_EQ(set.collected_signatures[0].signer, alice);

  auto attestation =
      query_id("/attestation", set.collected_signatures[0].attestation_id);
  ASSERT_EQ(attestation.code, 0u);
  auto record = encoder_.decode<attestation_record_t>(
      make_bytes_view(attestation.value));
  EXPECT_EQ(record.signer, alice);
  EXPECT_EQ(record.request_id, id);
}
