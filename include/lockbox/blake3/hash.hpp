#pragma once
#include <lockbox/schema/primitives.hpp>
#include <initializer_list>
#include <string_view>

namespace lockbox::blake3 {

lockbox::schema::hash32_t hash(const std::string_view& str);
lockbox::schema::hash32_t hash(const lockbox::schema::bytes_view_t& bytes);

/// Hash the concatenation of `parts` without materializing it.
lockbox::schema::hash32_t hash(
    std::initializer_list<lockbox::schema::bytes_view_t> parts);

}  // namespace lockbox::blake3
