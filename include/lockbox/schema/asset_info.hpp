#pragma once
#include <lockbox/schema/asset_kind.hpp>
#include <lockbox/schema/custom_fee.hpp>
#include <lockbox/schema/primitives.hpp>
#include <vector>

// Schema type: asset info.
// Metadata reported by the asset ledger for a collection. Read-only input to
// the eligibility guard.
namespace lockbox::schema {

template <uint16_t Version>
struct asset_info;

template <>
struct asset_info<1> final {
  uint16_t version{1};
  asset_type_id_t asset_type;
  asset_kind_t kind{asset_kind_t::non_fungible_unique};
  std::vector<custom_fee_t> custom_fees;
};

using asset_info_t = asset_info<1>;

}  // namespace lockbox::schema
