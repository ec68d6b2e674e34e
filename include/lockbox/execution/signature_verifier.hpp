#pragma once

#include <lockbox/schema/primitives.hpp>
#include <functional>

namespace lockbox::execution {

/// Checks `signature` by `signer` over the request signing bytes. The engine
/// defaults to lockbox::crypto::verify_signature under strict mode.
using signature_verifier_t =
    std::function<bool(const lockbox::schema::bytes_view_t& signing_bytes,
                       const lockbox::schema::signer_id_t& signer,
                       const lockbox::schema::signature_t& signature)>;

}  // namespace lockbox::execution
