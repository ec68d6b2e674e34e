#include <lockbox/blake3/hash.hpp>
#include <lockbox/schema/account.hpp>

#include <algorithm>

namespace lockbox::schema {

namespace {

template <typename Signer>
hash32_t hash_signer(uint8_t tag, const Signer& signer) {
  return lockbox::blake3::hash(
      {bytes_view_t{&tag, 1}, bytes_view_t{signer.public_key.data(),
                                           signer.public_key.size()}});
}

}  // namespace

account_id_t make_account_id(const signer_id_t& signer) {
  auto account = account_id_t{};
  std::visit(overloaded{[&](const ed25519_signer_id& value) {
                          account.value = hash_signer(0, value);
                        },
                        [&](const secp256k1_signer_id& value) {
                          account.value = hash_signer(1, value);
                        }},
             signer);
  return account;
}

std::optional<signer_id_t> try_make_signer(std::string_view hex) {
  auto bytes = try_from_hex(hex);
  if (!bytes) {
    return std::nullopt;
  }
  if (bytes->size() == 32) {
    auto signer = ed25519_signer_id{};
    std::copy(std::begin(*bytes), std::end(*bytes),
              std::begin(signer.public_key));
    return signer_id_t{signer};
  }
  if (bytes->size() == 33) {
    auto signer = secp256k1_signer_id{};
    std::copy(std::begin(*bytes), std::end(*bytes),
              std::begin(signer.public_key));
    return signer_id_t{signer};
  }
  return std::nullopt;
}

std::optional<account_id_t> try_make_account(std::string_view hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    return std::nullopt;
  }
  return account_id_t{hash.value()};
}

std::optional<asset_type_id_t> try_make_asset_type(std::string_view hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    return std::nullopt;
  }
  return asset_type_id_t{hash.value()};
}

}  // namespace lockbox::schema
