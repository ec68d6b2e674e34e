#pragma once
#include <lockbox/schema/primitives.hpp>

// Schema type: set administrator.
// Hands the administrator role to another account.
namespace lockbox::schema {

template <uint16_t Version>
struct set_administrator;

template <>
struct set_administrator<1> final {
  uint16_t version{1};
  account_id_t administrator;
};

using set_administrator_t = set_administrator<1>;

}  // namespace lockbox::schema
