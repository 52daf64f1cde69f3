#include <spdlog/spdlog.h>
#include <algorithm>
#include <launchpad/common/critical.hpp>
#include <launchpad/execution/journal.hpp>
#include <ranges>

namespace launchpad::execution {

journal::journal(launchpad::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

journal::~journal() {
  if (!finished_) {
    rollback();
  }
}

void journal::hold(std::mutex& mutex) {
  auto held = std::ranges::any_of(locks_, [&](const auto& lock) {
    return lock.mutex() == &mutex;
  });
  if (held) {
    return;
  }
  locks_.emplace_back(mutex);
}

void journal::on_rollback(std::function<void()> undo) {
  undo_.push_back(std::move(undo));
}

void journal::erase(launchpad::schema::bytes_t key) {
  writes_.push_back(launchpad::storage::write_operation{
      .key = std::move(key), .value = std::nullopt});
}

void journal::emit(
    std::string type,
    std::initializer_list<std::pair<std::string_view, std::string>>
        attributes) {
  auto event = launchpad::schema::transaction_event_t{};
  event.type = std::move(type);
  event.attributes.reserve(attributes.size());
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(launchpad::schema::transaction_event_attribute_t{
        .key = std::string{key}, .value = value, .index = true});
  }
  events_.push_back(std::move(event));
}

std::vector<launchpad::schema::transaction_event_t> journal::commit() {
  if (finished_) {
    launchpad::common::critical("journal committed twice");
  }
  storage_.write(writes_);
  for (const auto& event : events_) {
    auto rendered = std::string{};
    for (const auto& attribute : event.attributes) {
      rendered += " " + attribute.key + "=" + attribute.value;
    }
    spdlog::info("{}{}", event.type, rendered);
  }

  finished_ = true;
  undo_.clear();
  writes_.clear();
  release();
  return std::move(events_);
}

void journal::rollback() noexcept {
  if (finished_) {
    return;
  }
  finished_ = true;
  if (!undo_.empty()) {
    spdlog::debug("Rolling back {} staged mutation(s)", undo_.size());
  }
  for (auto& undo : std::ranges::reverse_view(undo_)) {
    try {
      undo();
    } catch (const std::exception& ex) {
      launchpad::common::critical("rollback left state inconsistent: {}",
                                  ex.what());
    }
  }
  undo_.clear();
  writes_.clear();
  events_.clear();
  release();
}

void journal::release() noexcept {
  while (!locks_.empty()) {
    locks_.pop_back();
  }
}

}  // namespace launchpad::execution
