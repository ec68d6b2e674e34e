#pragma once
#include <lockbox/schema/primitives.hpp>
#include <optional>
#include <span>

namespace lockbox::schema::encoding {

// Encoder facade selected at build time by tag. Callers never name the codec
// library directly; swapping it means adding a specialization.
template <typename Library>
struct encoder {
  template <typename T>
  lockbox::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, lockbox::schema::bytes_t& out);

  template <typename T>
  T decode(const lockbox::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const lockbox::schema::bytes_view_t& bytes);
};

}  // namespace lockbox::schema::encoding
