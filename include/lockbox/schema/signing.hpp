#pragma once
#include <lockbox/schema/transaction.hpp>
#include <tuple>

namespace lockbox::schema {

/// Bytes covered by a request signature: every envelope field except the
/// signature itself.
template <typename Encoder>
bytes_t make_signing_bytes(Encoder& encoder, const transaction_t& tx) {
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

}  // namespace lockbox::schema
