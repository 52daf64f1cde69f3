#include <gtest/gtest.h>
#include <launchpad/testing/runtime_fixture.hpp>
#include <launchpad/token/token_registry.hpp>

using namespace launchpad::schema;
using launchpad::testing::error_code_of;
using launchpad::testing::make_token_spec;

namespace {

class token_registry_test : public launchpad::testing::runtime_fixture {
 protected:
  address_t deploy(const account_id_t& caller,
                   const token_spec_t& spec,
                   const account_id_t& owner) {
    auto tx = launchpad::execution::journal{runtime().storage()};
    auto address = runtime().tokens().deploy(caller, spec, owner, tx);
    tx.commit();
    return address;
  }
};

}  // namespace

TEST_F(token_registry_test, mints_whole_supply_to_owner) {
  auto spec = make_token_spec();
  auto address = deploy(administrator, spec, requester);

  auto token = runtime().tokens().get(address);
  ASSERT_TRUE(token.has_value());
  EXPECT_EQ(token->address, address);
  EXPECT_EQ(token->owner, requester);
  EXPECT_EQ(token->spec.symbol, spec.symbol);
  EXPECT_EQ(token->minted, spec.total_supply);
  EXPECT_EQ(runtime().tokens().size(), 1u);
}

TEST_F(token_registry_test, identical_specs_get_distinct_addresses) {
  auto first = deploy(administrator, make_token_spec(), requester);
  auto second = deploy(administrator, make_token_spec(), requester);
  EXPECT_NE(first, second);
  EXPECT_EQ(runtime().tokens().size(), 2u);
}

TEST_F(token_registry_test, requires_deploy_capability) {
  auto tx = launchpad::execution::journal{runtime().storage()};
  EXPECT_EQ(error_code_of([&] {
              runtime().tokens().deploy(alice, make_token_spec(), alice, tx);
            }),
            transaction_error_code::not_authorized);
}

TEST_F(token_registry_test, rejects_empty_symbol) {
  auto tx = launchpad::execution::journal{runtime().storage()};
  EXPECT_EQ(error_code_of([&] {
              runtime().tokens().deploy(administrator,
                                        make_token_spec("Doge Two", ""),
                                        requester, tx);
            }),
            transaction_error_code::empty_symbol);
}

TEST_F(token_registry_test, rolled_back_deploy_leaves_no_token) {
  {
    auto tx = launchpad::execution::journal{runtime().storage()};
    runtime().tokens().deploy(administrator, make_token_spec(), requester, tx);
  }
  EXPECT_EQ(runtime().tokens().size(), 0u);
}

TEST_F(token_registry_test, nonce_survives_restart) {
  auto first = deploy(administrator, make_token_spec(), requester);
  reopen();
  ASSERT_TRUE(runtime().tokens().get(first).has_value());
  auto second = deploy(administrator, make_token_spec(), requester);
  EXPECT_NE(first, second);
  EXPECT_EQ(runtime().tokens().size(), 2u);
}
