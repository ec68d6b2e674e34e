#pragma once
#include <lockbox/schema/primitives.hpp>
#include <optional>
#include <string_view>

namespace lockbox::schema {

/// Ledger account controlled by a signer: BLAKE3 over the key type tag and
/// the public key bytes.
account_id_t make_account_id(const signer_id_t& signer);

/// Parse a hex public key: 32 bytes is ed25519, 33 bytes is compressed
/// secp256k1.
std::optional<signer_id_t> try_make_signer(std::string_view hex);

/// Parse a 32-byte hex account id.
std::optional<account_id_t> try_make_account(std::string_view hex);

/// Parse a 32-byte hex collection id.
std::optional<asset_type_id_t> try_make_asset_type(std::string_view hex);

}  // namespace lockbox::schema
