#pragma once

#include <lockbox/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace lockbox::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"lockbox-custody"};
  std::string version{"0.1.0"};
  uint64_t app_version{1};
  uint64_t last_sequence{};
  hash32_t state_root{};
};

using app_info_t = app_info<1>;

}  // namespace lockbox::schema
