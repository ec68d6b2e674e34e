#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace lockbox::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto found = std::find_if(
      std::begin(mappings), std::end(mappings),
      [&](const auto& mapping) { return mapping.first == value; });
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto found = std::find_if(
      std::begin(mappings), std::end(mappings),
      [&](const auto& mapping) { return mapping.second == value; });
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->first;
}

/// Specialized next to each enum that has a textual form.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value);

}  // namespace lockbox::schema
