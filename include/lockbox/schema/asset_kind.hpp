#pragma once

#include <lockbox/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: asset kind.
// Only unique-unit collections can be held in custody.
namespace lockbox::schema {

enum class asset_kind_t : uint8_t {
  fungible_common = 0,
  non_fungible_unique = 1,
};

inline constexpr auto kAssetKindMappings = enum_mappings_t<asset_kind_t, 2>{
    std::pair<std::string_view, asset_kind_t>{"fungible_common",
                                              asset_kind_t::fungible_common},
    std::pair<std::string_view, asset_kind_t>{
        "non_fungible_unique", asset_kind_t::non_fungible_unique},
};

template <>
inline std::optional<asset_kind_t> try_from_string<asset_kind_t>(
    const std::string_view value) {
  return from_string(value, kAssetKindMappings);
}

inline constexpr std::string_view to_string(const asset_kind_t value) {
  return to_string(value, kAssetKindMappings).value_or("unknown");
}

}  // namespace lockbox::schema
