#pragma once

#include <lockbox/schema/account.hpp>
#include <lockbox/schema/asset_info.hpp>
#include <lockbox/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace lockbox::testing {

inline lockbox::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = lockbox::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline lockbox::schema::account_id_t make_account(const uint8_t seed) {
  return lockbox::schema::account_id_t{make_hash(seed)};
}

inline lockbox::schema::asset_type_id_t make_asset_type(const uint8_t seed) {
  return lockbox::schema::asset_type_id_t{make_hash(seed)};
}

inline lockbox::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = lockbox::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

/// Eligible collection: unique units, no custom fees.
inline lockbox::schema::asset_info_t make_nft_info(
    const lockbox::schema::asset_type_id_t& asset_type) {
  auto info = lockbox::schema::asset_info_t{};
  info.asset_type = asset_type;
  info.kind = lockbox::schema::asset_kind_t::non_fungible_unique;
  return info;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace lockbox::testing
