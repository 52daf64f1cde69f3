#include <launchpad/common/critical.hpp>
#include <launchpad/storage/rocksdb/storage.hpp>

namespace launchpad::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    launchpad::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::write(
    const std::vector<write_operation>& operations) const {
  if (!database) {
    launchpad::common::critical("RocksDB database is not initialized");
  }
  if (operations.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : operations) {
    auto key_slice =
        detail::to_slice(launchpad::schema::bytes_view_t{key.data(), key.size()});
    auto status = value.has_value()
                      ? batch.Put(key_slice,
                                  detail::to_slice(launchpad::schema::bytes_view_t{
                                      value->data(), value->size()}))
                      : batch.Delete(key_slice);
    if (!status.ok()) {
      spdlog::error("Failed staging RocksDB batch entry: {}",
                    status.ToString());
      launchpad::common::critical("failed staging write batch");
    }
  }

  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}", status.ToString());
    launchpad::common::critical("failed to commit write batch");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const launchpad::schema::bytes_view_t& prefix) const {
  if (!database) {
    launchpad::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    launchpad::common::critical("failed iterating key prefix");
  }
  return entries;
}

}  // namespace launchpad::storage
