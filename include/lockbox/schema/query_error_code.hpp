#pragma once

#include <lockbox/schema/enum_string.hpp>
#include <cstdint>

// Read-route failures. Numbered separately from lock_error_code since query
// results carry their own codespace.
namespace lockbox::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

inline constexpr auto kQueryErrorCodeMappings =
    enum_mappings_t<query_error_code, 3>{
        std::pair<std::string_view, query_error_code>{
            "invalid_key", query_error_code::invalid_key},
        std::pair<std::string_view, query_error_code>{
            "not_found", query_error_code::not_found},
        std::pair<std::string_view, query_error_code>{
            "unsupported_path", query_error_code::unsupported_path},
};

template <>
inline std::optional<query_error_code> try_from_string<query_error_code>(
    const std::string_view value) {
  return from_string(value, kQueryErrorCodeMappings);
}

inline constexpr std::string_view to_string(const query_error_code value) {
  return to_string(value, kQueryErrorCodeMappings).value_or("unknown");
}

}  // namespace lockbox::schema
