#pragma once
#include <cstdint>

namespace lockbox::schema {

template <uint16_t Version>
struct set_paused;

template <>
struct set_paused<1> final {
  uint16_t version{1};
  bool paused{};
};

using set_paused_t = set_paused<1>;

}  // namespace lockbox::schema
