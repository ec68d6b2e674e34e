#include <lockbox/common/critical.hpp>
#include <lockbox/storage/rocksdb/storage.hpp>

namespace lockbox::storage {

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
    lockbox::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened lock store at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::erase(
    const lockbox::schema::bytes_view_t& key) const {
  if (!database) {
    lockbox::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete value from RocksDB: {}",
                  status.ToString());
    lockbox::common::critical("Failed to delete value from RocksDB");
  }
}

void storage<rocksdb_storage_tag>::write(
    const std::vector<write_entry_t>& entries) const {
  if (!database) {
    lockbox::common::critical("RocksDB database is not initialized");
  }
  if (entries.empty()) {
    return;
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  detail::stage(batch, entries);
  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    lockbox::common::critical("failed to commit write batch: {}",
                              status.ToString());
  }
}

void storage<rocksdb_storage_tag>::commit(
    const std::vector<write_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    lockbox::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.sequence, state.state_root});

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  detail::stage(batch, entries);
  auto state_status =
      batch.Put(std::string{detail::kCommittedStateKey},
                detail::to_slice(encoded));
  if (!state_status.ok()) {
    lockbox::common::critical("failed staging committed state");
  }
  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    lockbox::common::critical("failed to persist committed state: {}",
                              status.ToString());
  }
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    lockbox::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedStateKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    lockbox::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, lockbox::schema::hash32_t>>(
          lockbox::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    lockbox::common::critical("failed to decode committed state");
  }
  return committed_state{.sequence = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const lockbox::schema::bytes_view_t& prefix) const {
  if (!database) {
    lockbox::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
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
  return entries;
}

}  // namespace lockbox::storage
