#pragma once
#include <lockbox/schema/primitives.hpp>

// Schema type: governance state.
// Administrator identity and the pause switch. Pausing blocks association and
// lock creation only; extension and withdrawal stay available.
namespace lockbox::schema {

template <uint16_t Version>
struct governance_state;

template <>
struct governance_state<1> final {
  uint16_t version{1};
  account_id_t administrator;
  bool paused{};
};

using governance_state_t = governance_state<1>;

}  // namespace lockbox::schema
