#include <lockbox/execution/lock_store.hpp>
#include <lockbox/schema/key/engine_keys.hpp>

#include <spdlog/spdlog.h>

namespace lockbox::execution {

lock_store::lock_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<lockbox::schema::lock_record_t> lock_store::find(
    const lockbox::schema::asset_type_id_t& asset_type,
    const lockbox::schema::serial_number_t& serial_number) const {
  auto key =
      lockbox::schema::key::make_lock_key(encoder_, asset_type, serial_number);
  auto record =
      storage_.get<lockbox::schema::lock_record_t>(encoder_, key);
  // A zero-duration entry is indistinguishable from no lock.
  if (record && record->duration == 0) {
    return std::nullopt;
  }
  return record;
}

bool lock_store::exists(
    const lockbox::schema::asset_type_id_t& asset_type,
    const lockbox::schema::serial_number_t& serial_number) const {
  return find(asset_type, serial_number).has_value();
}

lockbox::storage::write_entry_t lock_store::stage_put(
    const lockbox::schema::lock_record_t& record) const {
  return {lockbox::schema::key::make_lock_key(encoder_, record.asset_type,
                                              record.serial_number),
          encoder_.encode(record)};
}

lockbox::storage::write_entry_t lock_store::stage_erase(
    const lockbox::schema::asset_type_id_t& asset_type,
    const lockbox::schema::serial_number_t& serial_number) const {
  return {lockbox::schema::key::make_lock_key(encoder_, asset_type,
                                              serial_number),
          std::nullopt};
}

void lock_store::erase(
    const lockbox::schema::asset_type_id_t& asset_type,
    const lockbox::schema::serial_number_t& serial_number) const {
  storage_.erase(
      lockbox::schema::key::make_lock_key(encoder_, asset_type, serial_number));
}

void lock_store::restore(const lockbox::schema::lock_record_t& record) const {
  spdlog::warn("Restoring lock {}#{} after failed release",
               lockbox::schema::to_string(record.asset_type),
               record.serial_number.value);
  storage_.write({stage_put(record)});
}

std::vector<lockbox::schema::lock_record_t> lock_store::list() const {
  auto prefix = lockbox::schema::key::make_prefix_key(
      encoder_, lockbox::schema::key::kLockKeyPrefix);
  auto records = std::vector<lockbox::schema::lock_record_t>{};
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    auto record =
        encoder_.try_decode<lockbox::schema::lock_record_t>(value);
    if (!record) {
      spdlog::warn("Skipping undecodable lock record");
      continue;
    }
    if (record->duration == 0) {
      continue;
    }
    records.push_back(std::move(record.value()));
  }
  return records;
}

}  // namespace lockbox::execution
