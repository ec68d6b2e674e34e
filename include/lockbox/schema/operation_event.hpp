#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema type: operation event.
// Notification emitted by a successful request: asset_associated,
// lock_created, lock_duration_extended, unlocked_asset_withdrawn and the
// administrative events. Identifiers are hex, numbers are decimal.
namespace lockbox::schema {

template <uint16_t Version>
struct operation_event_attribute;

template <>
struct operation_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using operation_event_attribute_t = operation_event_attribute<1>;

template <uint16_t Version>
struct operation_event;

template <>
struct operation_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<operation_event_attribute_t> attributes;
};

using operation_event_t = operation_event<1>;

}  // namespace lockbox::schema
