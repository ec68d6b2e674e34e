#pragma once
#include <lockbox/common/critical.hpp>
#include <lockbox/schema/encoding/encoder.hpp>
#include <lockbox/schema/encoding/scale/app_info.hpp>
#include <lockbox/schema/encoding/scale/asset_info.hpp>
#include <lockbox/schema/encoding/scale/associate_asset.hpp>
#include <lockbox/schema/encoding/scale/create_lock.hpp>
#include <lockbox/schema/encoding/scale/custom_fee.hpp>
#include <lockbox/schema/encoding/scale/extend_lock_duration.hpp>
#include <lockbox/schema/encoding/scale/fee_schedule.hpp>
#include <lockbox/schema/encoding/scale/governance_state.hpp>
#include <lockbox/schema/encoding/scale/lock_record.hpp>
#include <lockbox/schema/encoding/scale/primitives.hpp>
#include <lockbox/schema/encoding/scale/set_administrator.hpp>
#include <lockbox/schema/encoding/scale/set_paused.hpp>
#include <lockbox/schema/encoding/scale/transaction.hpp>
#include <lockbox/schema/encoding/scale/update_fee_schedule.hpp>
#include <lockbox/schema/encoding/scale/withdraw_unlocked_asset.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace lockbox::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  lockbox::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, lockbox::schema::bytes_t& out);

  template <typename T>
  T decode(const lockbox::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const lockbox::schema::bytes_view_t& bytes);
};

template <typename T>
lockbox::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    lockbox::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        lockbox::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const lockbox::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    lockbox::common::critical("failed to decode SCALE bytes");
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const lockbox::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace lockbox::schema::encoding
