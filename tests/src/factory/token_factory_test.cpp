#include <gtest/gtest.h>
#include <launchpad/factory/protocol.hpp>
#include <launchpad/factory/token_factory.hpp>
#include <launchpad/testing/runtime_fixture.hpp>

#include <string>
#include <vector>

using namespace launchpad::schema;
using launchpad::testing::error_code_of;
using launchpad::testing::make_token_spec;

namespace {

class token_factory_test : public launchpad::testing::runtime_fixture {};

}  // namespace

TEST_F(token_factory_test, ids_start_at_one_and_increase) {
  auto first = submit({alice, bob});
  auto second = submit({alice, bob, carol});
  EXPECT_EQ(first, 1u);
  EXPECT_EQ(second, 2u);
  EXPECT_EQ(runtime().factory().request_count(), 2u);

  auto record = runtime().factory().get_request(second);
  EXPECT_EQ(record.id, second);
  EXPECT_EQ(record.requester, requester);
  EXPECT_EQ(record.signers, (std::vector<account_id_t>{alice, bob, carol}));
  EXPECT_EQ(record.status, request_status_t::pending);
  EXPECT_FALSE(record.created_token.has_value());
  EXPECT_FALSE(record.created_pool.has_value());
}

TEST_F(token_factory_test, submission_opens_signature_set) {
  auto id = submit({alice, bob, carol});
  auto set = runtime().coordinator().get_signature_set(id);
  EXPECT_EQ(set.status, signature_set_status_t::open);
  EXPECT_EQ(set.requester, requester);
  EXPECT_EQ(set.eligible_signers,
            (std::vector<account_id_t>{alice, bob, carol}));
  EXPECT_TRUE(set.collected_signatures.empty());
}

TEST_F(token_factory_test, rejects_invalid_submissions_without_state_change) {
  auto& factory = runtime().factory();
  EXPECT_EQ(error_code_of([&] {
              factory.submit_creation_request({alice}, requester,
                                              make_token_spec());
            }),
            transaction_error_code::invalid_signer_count);
  EXPECT_EQ(error_code_of([&] {
              factory.submit_creation_request({alice, alice}, requester,
                                              make_token_spec());
            }),
            transaction_error_code::duplicate_signer);
  EXPECT_EQ(error_code_of([&] {
              factory.submit_creation_request({alice, bob}, requester,
                                              make_token_spec("", "SYM"));
            }),
            transaction_error_code::empty_name);
  EXPECT_EQ(error_code_of([&] {
              factory.submit_creation_request({alice, bob}, requester,
                                              make_token_spec("Name", ""));
            }),
            transaction_error_code::empty_symbol);

  auto zero_supply = make_token_spec();
  zero_supply.total_supply = 0;
  EXPECT_EQ(error_code_of([&] {
              factory.submit_creation_request({alice, bob}, requester,
                                              zero_supply);
            }),
            transaction_error_code::invalid_supply);

  auto under_cap = make_token_spec();
  under_cap.max_supply = under_cap.total_supply - 1;
  EXPECT_EQ(error_code_of([&] {
              factory.submit_creation_request({alice, bob}, requester,
                                              under_cap);
            }),
            transaction_error_code::invalid_supply);

  EXPECT_EQ(factory.request_count(), 0u);
  EXPECT_EQ(submit({alice, bob}), 1u);
}

TEST_F(token_factory_test, uncapped_supply_ignores_max_supply) {
  auto spec = make_token_spec();
  spec.supply_capped = false;
  spec.max_supply = 0;
  auto id =
      runtime().factory().submit_creation_request({alice, bob}, requester, spec);
  EXPECT_EQ(id, 1u);
}

TEST_F(token_factory_test, unknown_request_is_not_found) {
  EXPECT_EQ(error_code_of([&] { runtime().factory().get_request(1); }),
            transaction_error_code::not_found);
  EXPECT_EQ(error_code_of([&] {
              runtime().factory().get_request(kSentinelRequestId);
            }),
            transaction_error_code::not_found);
}

TEST_F(token_factory_test, execute_creation_requires_coordinator_or_admin) {
  auto id = submit({alice, bob, carol});
  EXPECT_EQ(error_code_of([&] {
              runtime().factory().execute_creation(alice, id);
            }),
            transaction_error_code::not_authorized);
  EXPECT_EQ(runtime().factory().get_request(id).status,
            request_status_t::pending);

  runtime().factory().execute_creation(administrator, id);
  auto record = runtime().factory().get_request(id);
  EXPECT_EQ(record.status, request_status_t::executed);
  ASSERT_TRUE(record.created_token.has_value());
  ASSERT_TRUE(record.created_pool.has_value());

  auto token = runtime().tokens().get(*record.created_token);
  ASSERT_TRUE(token.has_value());
  EXPECT_EQ(token->owner, requester);
  EXPECT_EQ(token->minted, make_token_spec().total_supply);

  auto pool = runtime().pools().get_pool(*record.created_pool);
  ASSERT_TRUE(pool.has_value());
  EXPECT_EQ(pool->key.fee, launchpad::factory::kPoolFee);
  EXPECT_EQ(pool->key.tick_spacing, launchpad::factory::kPoolTickSpacing);
  EXPECT_EQ(pool->key.currency0, launchpad::factory::kReferenceCurrency);
  EXPECT_EQ(pool->key.currency1, *record.created_token);
  EXPECT_EQ(pool->key.hooks, runtime().pools().identity());
  EXPECT_EQ(pool->sqrt_price_x96,
            sqrt_price_x96_t{"79228162514264337593543950336"});

  EXPECT_EQ(error_code_of([&] {
              runtime().factory().execute_creation(administrator, id);
            }),
            transaction_error_code::transaction_already_executed);
}

TEST_F(token_factory_test, failed_pool_initialization_leaves_request_pending) {
  auto bootstrap = launchpad::testing::failing_bootstrap{};
  runtime().factory().set_liquidity_bootstrap(administrator, bootstrap);
  auto id = submit({alice, bob});

  EXPECT_EQ(error_code_of([&] {
              runtime().factory().execute_creation(administrator, id);
            }),
            transaction_error_code::pool_already_initialized);
  EXPECT_EQ(bootstrap.calls, 1);

  auto record = runtime().factory().get_request(id);
  EXPECT_EQ(record.status, request_status_t::pending);
  EXPECT_FALSE(record.created_token.has_value());
  EXPECT_EQ(runtime().tokens().size(), 0u);
}

TEST_F(token_factory_test, foreign_exceptions_become_integration_failures) {
  auto bootstrap = launchpad::testing::failing_bootstrap{false};
  runtime().factory().set_liquidity_bootstrap(administrator, bootstrap);
  auto id = submit({alice, bob});

  EXPECT_EQ(error_code_of([&] {
              runtime().factory().execute_creation(administrator, id);
            }),
            transaction_error_code::integration_failure);
  EXPECT_EQ(runtime().factory().get_request(id).status,
            request_status_t::pending);
}

TEST_F(token_factory_test, rebinding_requires_administrator) {
  auto bootstrap = launchpad::testing::failing_bootstrap{};
  EXPECT_EQ(error_code_of([&] {
              runtime().factory().set_liquidity_bootstrap(alice, bootstrap);
            }),
            transaction_error_code::not_authorized);
  EXPECT_EQ(error_code_of([&] {
              runtime().factory().set_coordinator(alice,
                                                  runtime().coordinator());
            }),
            transaction_error_code::not_authorized);
}

TEST_F(token_factory_test, requests_survive_restart) {
  auto first = submit({alice, bob});
  runtime().factory().execute_creation(administrator, first);
  auto executed = runtime().factory().get_request(first);

  reopen();

  auto reloaded = runtime().factory().get_request(first);
  EXPECT_EQ(reloaded.status, request_status_t::executed);
  EXPECT_EQ(reloaded.created_token, executed.created_token);
  EXPECT_EQ(reloaded.created_pool, executed.created_pool);
  EXPECT_EQ(submit({alice, bob}), 2u);
}

TEST_F(token_factory_test, rolled_back_submission_frees_only_uncommitted_id) {
  auto first = submit({alice, bob});
  {
    auto tx = launchpad::execution::journal{runtime().storage()};
    EXPECT_EQ(runtime().factory().submit_creation_request(
                  {alice, bob}, requester, make_token_spec(), tx),
              first + 1);
  }
  EXPECT_FALSE(runtime().factory().try_get_request(first + 1).has_value());
  EXPECT_FALSE(
      runtime().coordinator().try_get_signature_set(first + 1).has_value());

  auto second = submit({alice, carol});
  EXPECT_EQ(second, first + 1);
  EXPECT_EQ(runtime().factory().get_request(first).signers,
            (std::vector<account_id_t>{alice, bob}));
  EXPECT_EQ(runtime().factory().get_request(second).signers,
            (std::vector<account_id_t>{alice, carol}));
  EXPECT_EQ(submit({bob, carol}), second + 1);
}
