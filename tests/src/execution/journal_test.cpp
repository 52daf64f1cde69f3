#include <gtest/gtest.h>
#include <launchpad/execution/journal.hpp>
#include <launchpad/schema/encoding/scale/encoder.hpp>
#include <launchpad/testing/common.hpp>

#include <mutex>
#include <string>
#include <vector>

using namespace launchpad::schema;

namespace {

class journal_test : public ::testing::Test {
 protected:
  void SetUp() override {
    db_path_ = launchpad::testing::make_db_path("launchpad_journal");
    storage_ = std::make_unique<launchpad::storage::rocksdb_storage_t>(
        launchpad::storage::make_storage<
            launchpad::storage::rocksdb_storage_tag>(db_path_));
  }

  void TearDown() override {
    storage_.reset();
    launchpad::testing::remove_path(db_path_);
  }

  std::optional<uint64_t> read(const std::string_view key) {
    auto encoder = launchpad::scale_encoder_t{};
    auto bytes = make_bytes(key);
    return storage_->get<uint64_t>(encoder, make_bytes_view(bytes));
  }

  std::string db_path_;
  std::unique_ptr<launchpad::storage::rocksdb_storage_t> storage_;
};

}  // namespace

TEST_F(journal_test, commit_writes_rows_and_returns_events) {
  auto tx = launchpad::execution::journal{*storage_};
  tx.put(make_bytes(std::string_view{"K|1"}), uint64_t{7});
  tx.emit("thing_happened", {{"id", "1"}, {"by", "alice"}});
  auto events = tx.commit();

  EXPECT_TRUE(tx.finished());
  EXPECT_EQ(read("K|1"), uint64_t{7});
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, "thing_happened");
  ASSERT_EQ(events[0].attributes.size(), 2u);
  EXPECT_EQ(events[0].attributes[1].key, "by");
  EXPECT_EQ(events[0].attributes[1].value, "alice");
}

TEST_F(journal_test, destruction_without_commit_rolls_back_in_reverse) {
  auto order = std::vector<int>{};
  {
    auto tx = launchpad::execution::journal{*storage_};
    tx.put(make_bytes(std::string_view{"K|2"}), uint64_t{9});
    tx.on_rollback([&] { order.push_back(1); });
    tx.on_rollback([&] { order.push_back(2); });
  }
  EXPECT_EQ(order, (std::vector<int>{2, 1}));
  EXPECT_FALSE(read("K|2").has_value());
}

TEST_F(journal_test, erase_deletes_committed_rows) {
  {
    auto tx = launchpad::execution::journal{*storage_};
    tx.put(make_bytes(std::string_view{"K|3"}), uint64_t{1});
    tx.commit();
  }
  auto tx = launchpad::execution::journal{*storage_};
  tx.erase(make_bytes(std::string_view{"K|3"}));
  tx.commit();
  EXPECT_FALSE(read("K|3").has_value());
}

TEST_F(journal_test, holds_locks_until_finished) {
  auto mutex = std::mutex{};
  {
    auto tx = launchpad::execution::journal{*storage_};
    tx.hold(mutex);
    tx.hold(mutex);
    EXPECT_FALSE(mutex.try_lock());
    tx.commit();
    ASSERT_TRUE(mutex.try_lock());
    mutex.unlock();
  }
  {
    auto tx = launchpad::execution::journal{*storage_};
    tx.hold(mutex);
  }
  ASSERT_TRUE(mutex.try_lock());
  mutex.unlock();
}
