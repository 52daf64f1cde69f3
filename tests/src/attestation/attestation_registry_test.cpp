#include <gtest/gtest.h>
#include <launchpad/attestation/attestation_registry.hpp>
#include <launchpad/testing/runtime_fixture.hpp>

using namespace launchpad::schema;
using launchpad::testing::error_code_of;

namespace {

class attestation_registry_test : public launchpad::testing::runtime_fixture {
 protected:
  attestation_id_t record(const request_id_t id, const account_id_t& signer) {
    auto tx = launchpad::execution::journal{runtime().storage()};
    auto attestation = runtime().attestations().record_signature(
        runtime().coordinator().identity(), id, signer, tx);
    tx.commit();
    return attestation;
  }

  void revoke(const attestation_id_t id, const std::string& reason) {
    auto tx = launchpad::execution::journal{runtime().storage()};
    runtime().attestations().revoke_signature(
        runtime().coordinator().identity(), id, reason, tx);
    tx.commit();
  }
};

}  // namespace

TEST_F(attestation_registry_test, ids_are_sequential) {
  EXPECT_EQ(record(1, alice), 1u);
  EXPECT_EQ(record(1, bob), 2u);
  EXPECT_EQ(record(2, alice), 3u);

  auto latest = runtime().attestations().latest_for(1, alice);
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->id, 1u);
  EXPECT_EQ(latest->request_id, 1u);
  EXPECT_EQ(latest->signer, alice);
}

TEST_F(attestation_registry_test, revoke_marks_record) {
  auto id = record(4, carol);
  revoke(id, "withdrawn");
  auto stored = runtime().attestations().get(id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, attestation_status_t::revoked);
  EXPECT_EQ(stored->revoke_reason, "withdrawn");

  EXPECT_EQ(error_code_of([&] { revoke(id, "again"); }),
            transaction_error_code::attestation_already_revoked);
  EXPECT_EQ(error_code_of([&] { revoke(42, "missing"); }),
            transaction_error_code::not_found);
}

TEST_F(attestation_registry_test, requires_record_capability) {
  auto tx = launchpad::execution::journal{runtime().storage()};
  EXPECT_EQ(error_code_of([&] {
              runtime().attestations().record_signature(alice, 1, alice, tx);
            }),
            transaction_error_code::not_authorized);
}

TEST_F(attestation_registry_test, rollback_releases_the_id) {
  {
    auto tx = launchpad::execution::journal{runtime().storage()};
    runtime().attestations().record_signature(
        runtime().coordinator().identity(), 1, alice, tx);
  }
  EXPECT_FALSE(runtime().attestations().get(1).has_value());
  EXPECT_FALSE(runtime().attestations().latest_for(1, alice).has_value());
  EXPECT_EQ(record(1, alice), 1u);
}

TEST_F(attestation_registry_test, records_survive_restart) {
  record(1, alice);
  auto second = record(1, bob);
  revoke(second, "withdrawn");
  reopen();

  auto stored = runtime().attestations().get(second);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, attestation_status_t::revoked);
  EXPECT_EQ(record(1, carol), 3u);
}
