#include <lockbox/execution/eligibility_guard.hpp>

#include <fmt/format.h>

namespace lockbox::execution {

std::optional<std::string> check_lockable(
    const std::optional<lockbox::schema::asset_info_t>& info) {
  if (!info) {
    return std::string{"asset type unknown to ledger"};
  }
  if (info->kind != lockbox::schema::asset_kind_t::non_fungible_unique) {
    return fmt::format("asset kind {} is not lockable",
                       lockbox::schema::to_string(info->kind));
  }
  if (info->custom_fees.empty()) {
    return std::nullopt;
  }
  const auto& fee = info->custom_fees.front();
  if (fee.fallback_amount.has_value()) {
    return std::string{"asset carries a royalty fallback fee"};
  }
  return fmt::format("asset carries {} custom fee(s), first is {}",
                     info->custom_fees.size(),
                     lockbox::schema::to_string(fee.kind));
}

}  // namespace lockbox::execution
