#pragma once
#include <lockbox/schema/primitives.hpp>

// Schema type: withdraw unlocked asset.
// Anyone may trigger release of an expired lock; the unit always goes to the
// stored beneficiary.
namespace lockbox::schema {

template <uint16_t Version>
struct withdraw_unlocked_asset;

template <>
struct withdraw_unlocked_asset<1> final {
  uint16_t version{1};
  asset_type_id_t asset_type;
  serial_number_t serial_number;
};

using withdraw_unlocked_asset_t = withdraw_unlocked_asset<1>;

}  // namespace lockbox::schema
