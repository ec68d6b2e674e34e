#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lockbox::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using amount_t = boost::multiprecision::uint256_t;
using amount_bytes_t = std::array<uint8_t, 32>;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

/// Ledger account. The all-zero value is the null account and never owns a
/// lock.
struct account_id_t final {
  hash32_t value{};

  bool is_null() const { return value == hash32_t{}; }
  auto operator<=>(const account_id_t&) const = default;
};

/// Asset collection identifier. The all-zero value is the null collection.
struct asset_type_id_t final {
  hash32_t value{};

  bool is_null() const { return value == hash32_t{}; }
  auto operator<=>(const asset_type_id_t&) const = default;
};

/// Unit identifier within a collection. Zero and negative serials are
/// reserved for "no lock".
struct serial_number_t final {
  int64_t value{};

  bool is_valid() const { return value > 0; }
  auto operator<=>(const serial_number_t&) const = default;
};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);

/// Fixed-width little-endian form used on the wire and in storage.
amount_bytes_t to_amount_bytes(const amount_t& amount);
amount_t from_amount_bytes(const amount_bytes_t& bytes);

std::string to_string(const account_id_t& account);
std::string to_string(const asset_type_id_t& asset_type);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;
};

using signer_id_t = std::variant<ed25519_signer_id, secp256k1_signer_id>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

}  // namespace lockbox::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
