#pragma once

#include <lockbox/schema/encoding/scale/encoder.hpp>
#include <lockbox/schema/lock_record.hpp>
#include <lockbox/storage/rocksdb/storage.hpp>
#include <optional>
#include <vector>

namespace lockbox::execution {

/// Durable (asset type, serial) -> lock record mapping. The only owner of lock
/// records; the engine re-reads through it on every call.
class lock_store final {
 public:
  using encoder_t = lockbox::schema::encoding::encoder<
      lockbox::schema::encoding::scale_encoder_tag>;
  using storage_t =
      lockbox::storage::storage<lockbox::storage::rocksdb_storage_tag>;

  lock_store(encoder_t& encoder, storage_t& storage);

  std::optional<lockbox::schema::lock_record_t> find(
      const lockbox::schema::asset_type_id_t& asset_type,
      const lockbox::schema::serial_number_t& serial_number) const;

  bool exists(const lockbox::schema::asset_type_id_t& asset_type,
              const lockbox::schema::serial_number_t& serial_number) const;

  /// Mutation to be committed with the rest of the request.
  lockbox::storage::write_entry_t stage_put(
      const lockbox::schema::lock_record_t& record) const;

  /// Deletion to be committed with the rest of the request.
  lockbox::storage::write_entry_t stage_erase(
      const lockbox::schema::asset_type_id_t& asset_type,
      const lockbox::schema::serial_number_t& serial_number) const;

  /// Write-through removal, visible to any call made before this request
  /// completes.
  void erase(const lockbox::schema::asset_type_id_t& asset_type,
             const lockbox::schema::serial_number_t& serial_number) const;

  /// Write-through reinstatement of a previously erased record.
  void restore(const lockbox::schema::lock_record_t& record) const;

  std::vector<lockbox::schema::lock_record_t> list() const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace lockbox::execution
