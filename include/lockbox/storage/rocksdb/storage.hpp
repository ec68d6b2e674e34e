#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <lockbox/common/critical.hpp>
#include <lockbox/schema/encoding/scale/encoder.hpp>
#include <lockbox/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>

namespace lockbox::storage {

namespace detail {

using encoder_t = lockbox::schema::encoding::encoder<
    lockbox::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline lockbox::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const lockbox::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline void stage(ROCKSDB_NAMESPACE::WriteBatch& batch,
                  const std::vector<write_entry_t>& entries) {
  for (const auto& [key, value] : entries) {
    auto status = value.has_value()
                      ? batch.Put(to_slice(key), to_slice(value.value()))
                      : batch.Delete(to_slice(key));
    if (!status.ok()) {
      lockbox::common::critical("failed staging write batch entry: {}",
                                status.ToString());
    }
  }
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const lockbox::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const lockbox::schema::bytes_view_t& key,
           const T& value) const;

  void erase(const lockbox::schema::bytes_view_t& key) const;
  void write(const std::vector<write_entry_t>& entries) const;
  void commit(const std::vector<write_entry_t>& entries,
              const committed_state& state) const;
  std::optional<committed_state> load_committed_state() const;
  std::vector<key_value_entry_t> list_by_prefix(
      const lockbox::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const lockbox::schema::bytes_view_t& key) const {
  if (!database) {
    lockbox::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      lockbox::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(lockbox::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const lockbox::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    lockbox::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key),
                              detail::to_slice(encoded_value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    lockbox::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace lockbox::storage
