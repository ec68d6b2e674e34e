#pragma once

#include <lockbox/schema/enum_string.hpp>
#include <lockbox/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: custom fee.
// A fee schedule entry attached to an asset collection by its issuer. Any
// entry makes the collection ineligible for custody because a custody
// transfer would trigger it.
namespace lockbox::schema {

enum class custom_fee_kind_t : uint8_t {
  fixed = 0,
  fractional = 1,
  royalty = 2,
};

inline constexpr auto kCustomFeeKindMappings =
    enum_mappings_t<custom_fee_kind_t, 3>{
        std::pair<std::string_view, custom_fee_kind_t>{
            "fixed", custom_fee_kind_t::fixed},
        std::pair<std::string_view, custom_fee_kind_t>{
            "fractional", custom_fee_kind_t::fractional},
        std::pair<std::string_view, custom_fee_kind_t>{
            "royalty", custom_fee_kind_t::royalty},
    };

template <>
inline std::optional<custom_fee_kind_t> try_from_string<custom_fee_kind_t>(
    const std::string_view value) {
  return from_string(value, kCustomFeeKindMappings);
}

inline constexpr std::string_view to_string(const custom_fee_kind_t value) {
  return to_string(value, kCustomFeeKindMappings).value_or("unknown");
}

template <uint16_t Version>
struct custom_fee;

template <>
struct custom_fee<1> final {
  uint16_t version{1};
  custom_fee_kind_t kind{custom_fee_kind_t::fixed};
  account_id_t collector;
  // Fixed amount, or numerator for fractional/royalty fees.
  uint64_t numerator{};
  uint64_t denominator{1};
  // Royalty fees only: amount charged when no fungible value is exchanged.
  std::optional<uint64_t> fallback_amount;
};

using custom_fee_t = custom_fee<1>;

}  // namespace lockbox::schema
