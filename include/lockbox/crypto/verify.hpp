#pragma once

#include <lockbox/schema/primitives.hpp>

namespace lockbox::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

/// ed25519 signs the message directly. secp256k1 signs its SHA-256 digest and
/// carries a recovery byte, accepted at either end of the 65 bytes.
bool verify_signature(const lockbox::schema::bytes_view_t& message,
                      const lockbox::schema::signer_id_t& signer,
                      const lockbox::schema::signature_t& signature);

}  // namespace lockbox::crypto
