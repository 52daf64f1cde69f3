#pragma once

#include <launchpad/schema/encoding/scale/encoder.hpp>
#include <launchpad/schema/primitives.hpp>
#include <launchpad/schema/transaction_event.hpp>
#include <launchpad/storage/rocksdb/storage.hpp>

#include <functional>
#include <initializer_list>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace launchpad::execution {

/// Scope of one state transition across every component it touches.
///
/// A journal is created by the entry point of a mutating call and passed down
/// the call chain (coordinator -> factory -> deployer/bootstrap -> notifier).
/// Each component:
/// - locks the rows it mutates through `hold`, so the locks stay held until
///   the whole chain commits or rolls back,
/// - registers an undo action for each in-memory mutation,
/// - stages the storage rows it wants written,
/// - emits events that only become visible on commit.
///
/// Destroying a journal that was not committed runs the undo actions in
/// reverse order and discards staged rows and events.
class journal final {
 public:
  explicit journal(launchpad::storage::rocksdb_storage_t& storage);
  ~journal();

  journal(const journal&) = delete;
  journal& operator=(const journal&) = delete;
  journal(journal&&) = delete;
  journal& operator=(journal&&) = delete;

  /// Lock `mutex` until the journal finishes. Holding a mutex this journal
  /// already owns is a no-op.
  void hold(std::mutex& mutex);

  void on_rollback(std::function<void()> undo);

  template <typename T>
  void put(launchpad::schema::bytes_t key, const T& value) {
    auto encoder = launchpad::scale_encoder_t{};
    writes_.push_back(launchpad::storage::write_operation{
        .key = std::move(key), .value = encoder.encode(value)});
  }

  void erase(launchpad::schema::bytes_t key);

  void emit(std::string type,
            std::initializer_list<std::pair<std::string_view, std::string>>
                attributes);

  /// Persist staged rows in a single batch, publish events and release locks.
  std::vector<launchpad::schema::transaction_event_t> commit();

  void rollback() noexcept;

  bool finished() const { return finished_; }

 private:
  void release() noexcept;

  launchpad::storage::rocksdb_storage_t& storage_;
  std::vector<std::unique_lock<std::mutex>> locks_;
  std::vector<std::function<void()>> undo_;
  std::vector<launchpad::storage::write_operation> writes_;
  std::vector<launchpad::schema::transaction_event_t> events_;
  bool finished_{false};
};

}  // namespace launchpad::execution
