#pragma once
#include <lockbox/schema/primitives.hpp>

// Schema type: associate asset.
// Opens the custody account to an asset collection so it can receive units.
namespace lockbox::schema {

template <uint16_t Version>
struct associate_asset;

template <>
struct associate_asset<1> final {
  uint16_t version{1};
  asset_type_id_t asset_type;
};

using associate_asset_t = associate_asset<1>;

}  // namespace lockbox::schema
