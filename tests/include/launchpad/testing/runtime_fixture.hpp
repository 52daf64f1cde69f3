#pragma once

#include <launchpad/common/error.hpp>
#include <launchpad/config/settings.hpp>
#include <launchpad/execution/runtime.hpp>
#include <launchpad/liquidity/liquidity_bootstrap.hpp>
#include <launchpad/testing/common.hpp>

#include <gtest/gtest.h>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace launchpad::testing {

/// Catch a domain error and return its code, failing the test when the call
/// succeeds or throws anything else.
inline launchpad::schema::transaction_error_code error_code_of(
    const std::function<void()>& call) {
  try {
    call();
  } catch (const launchpad::common::error& e) {
    return e.code();
  }
  ADD_FAILURE() << "expected launchpad::common::error";
  return launchpad::schema::transaction_error_code::invalid_transaction;
}

/// Liquidity bootstrap whose pool initialization always fails, either with a
/// domain error or with a foreign exception.
class failing_bootstrap final : public launchpad::liquidity::liquidity_bootstrap {
 public:
  explicit failing_bootstrap(bool domain_error = true)
      : domain_error_{domain_error} {}

  const launchpad::schema::account_id_t& identity() const override {
    return identity_;
  }

  launchpad::schema::pool_id_t initialize_pool(
      const launchpad::schema::address_t&,
      const launchpad::schema::address_t&,
      uint32_t,
      int32_t,
      const launchpad::schema::sqrt_price_x96_t&,
      launchpad::execution::journal&) override {
    ++calls;
    if (domain_error_) {
      launchpad::common::fail(
          launchpad::schema::transaction_error_code::pool_already_initialized,
          "pool already initialized");
    }
    throw std::runtime_error{"pool service unavailable"};
  }

  int calls{0};

 private:
  bool domain_error_;
  launchpad::schema::account_id_t identity_{make_identity("failing-bootstrap")};
};

/// Fresh runtime on a temporary RocksDB directory.
class runtime_fixture : public ::testing::Test {
 protected:
  void SetUp() override {
    settings_.db_path = make_db_path("launchpad_test");
    settings_.administrator = administrator;
    settings_.vesting.liquidity_threshold = 1'000;
    settings_.vesting.grant_amount = 500;
    settings_.vesting.grant_duration = 60'000;
    settings_.vesting.max_grants_per_pool = 2;
    configure(settings_);
    runtime_ = std::make_unique<launchpad::execution::runtime>(settings_);
  }

  void TearDown() override {
    runtime_.reset();
    remove_path(settings_.db_path);
  }

  /// Override to adjust settings before the runtime is built.
  virtual void configure(launchpad::config::settings&) {}

  /// Close and reopen the runtime on the same database.
  void reopen() {
    runtime_.reset();
    runtime_ = std::make_unique<launchpad::execution::runtime>(settings_);
  }

  launchpad::execution::runtime& runtime() { return *runtime_; }

  launchpad::schema::request_id_t submit(
      const std::vector<launchpad::schema::account_id_t>& signers) {
    return runtime_->factory().submit_creation_request(signers, requester,
                                                       make_token_spec());
  }

  const launchpad::schema::account_id_t administrator{
      make_identity("administrator")};
  const launchpad::schema::account_id_t requester{make_identity("requester")};
  const launchpad::schema::account_id_t alice{make_identity("alice")};
  const launchpad::schema::account_id_t bob{make_identity("bob")};
  const launchpad::schema::account_id_t carol{make_identity("carol")};
  const launchpad::schema::account_id_t dave{make_identity("dave")};

  launchpad::config::settings settings_{};
  std::unique_ptr<launchpad::execution::runtime> runtime_;
};

}  // namespace launchpad::testing
