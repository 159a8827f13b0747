#include <provenance/common/critical.hpp>
#include <provenance/storage/rocksdb/storage.hpp>

namespace provenance::storage {

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
    provenance::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::require_open() const {
  if (!database) {
    provenance::common::critical("RocksDB database is not initialized");
  }
}

bool storage<rocksdb_storage_tag>::contains(
    const provenance::schema::bytes_view_t& key) const {
  require_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    provenance::common::critical("Failed to probe key in RocksDB",
                                 status.ToString());
  }
  return true;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const provenance::schema::bytes_view_t& prefix) const {
  require_open();

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = provenance::schema::make_string_view(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(detail::to_slice(prefix));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    provenance::common::critical("Failed iterating RocksDB prefix",
                                 iterator->status().ToString());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::write(const write_batch& batch) const {
  require_open();

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.deletes) {
    auto delete_status = rocks_batch.Delete(
        detail::to_slice(provenance::schema::make_bytes_view(key)));
    if (!delete_status.ok()) {
      provenance::common::critical("failed staging delete in write batch",
                                   delete_status.ToString());
    }
  }
  for (const auto& [key, value] : batch.puts) {
    auto put_status = rocks_batch.Put(
        detail::to_slice(provenance::schema::make_bytes_view(key)),
        detail::to_slice(provenance::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      provenance::common::critical("failed staging put in write batch",
                                   put_status.ToString());
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocks_batch);
  if (!write_status.ok()) {
    provenance::common::critical("failed to commit write batch",
                                 write_status.ToString());
  }
}

}  // namespace provenance::storage
