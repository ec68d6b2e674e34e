#include <spdlog/spdlog.h>
#include <lockbox/ledger/in_memory_ledger.hpp>

using namespace lockbox::schema;

namespace lockbox::ledger {

void in_memory_ledger::set_asset_info(const asset_info_t& info) {
  auto lock = std::scoped_lock{mutex_};
  asset_infos_[info.asset_type] = info;
}

void in_memory_ledger::remove_asset_info(const asset_type_id_t& asset_type) {
  auto lock = std::scoped_lock{mutex_};
  asset_infos_.erase(asset_type);
}

bool in_memory_ledger::mint(const asset_type_id_t& asset_type,
                            const serial_number_t& serial_number,
                            const account_id_t& owner) {
  auto lock = std::scoped_lock{mutex_};
  auto [it, inserted] =
      owners_.try_emplace(unit_key_t{asset_type, serial_number}, owner);
  if (!inserted) {
    return false;
  }
  associations_.emplace(owner, asset_type);
  return true;
}

void in_memory_ledger::credit(const account_id_t& account,
                              const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  balances_[account] += amount;
}

std::optional<account_id_t> in_memory_ledger::owner_of(
    const asset_type_id_t& asset_type,
    const serial_number_t& serial_number) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = owners_.find(unit_key_t{asset_type, serial_number});
  if (it == std::end(owners_)) {
    return std::nullopt;
  }
  return it->second;
}

bool in_memory_ledger::is_associated(const account_id_t& account,
                                     const asset_type_id_t& asset_type) const {
  auto lock = std::scoped_lock{mutex_};
  return associations_.contains({account, asset_type});
}

bool in_memory_ledger::associate(const account_id_t& account,
                                 const asset_type_id_t& asset_type) {
  auto lock = std::scoped_lock{mutex_};
  if (!asset_infos_.contains(asset_type)) {
    spdlog::debug("Association refused: unknown collection {}",
                  to_string(asset_type));
    return false;
  }
  associations_.emplace(account, asset_type);
  return true;
}

bool in_memory_ledger::transfer(const asset_type_id_t& asset_type,
                                const serial_number_t& serial_number,
                                const account_id_t& from,
                                const account_id_t& to) {
  // Interceptors may call back into the custody engine; run them unlocked.
  auto interceptor = transfer_interceptor_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    interceptor = transfer_interceptor_;
  }
  if (interceptor && !interceptor(asset_type, serial_number, from, to)) {
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  auto it = owners_.find(unit_key_t{asset_type, serial_number});
  if (it == std::end(owners_) || it->second != from) {
    spdlog::debug("Transfer refused: {}#{} not held by {}",
                  to_string(asset_type), serial_number.value, to_string(from));
    return false;
  }
  if (!associations_.contains({to, asset_type})) {
    spdlog::debug("Transfer refused: {} not associated with {}", to_string(to),
                  to_string(asset_type));
    return false;
  }
  it->second = to;
  return true;
}

amount_t in_memory_ledger::fee_balance(const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = balances_.find(account);
  return it == std::end(balances_) ? amount_t{0} : it->second;
}

bool in_memory_ledger::charge_fee(const account_id_t& payer,
                                  const account_id_t& collector,
                                  const amount_t& amount) {
  auto interceptor = charge_interceptor_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    interceptor = charge_interceptor_;
  }
  if (interceptor && !interceptor(payer, collector, amount)) {
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  auto it = balances_.find(payer);
  if (it == std::end(balances_) || it->second < amount) {
    spdlog::debug("Charge refused: {} lacks {}", to_string(payer),
                  amount.str());
    return false;
  }
  it->second -= amount;
  balances_[collector] += amount;
  return true;
}

std::optional<asset_info_t> in_memory_ledger::asset_info(
    const asset_type_id_t& asset_type) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = asset_infos_.find(asset_type);
  if (it == std::end(asset_infos_)) {
    return std::nullopt;
  }
  return it->second;
}

void in_memory_ledger::set_transfer_interceptor(
    transfer_interceptor_t interceptor) {
  auto lock = std::scoped_lock{mutex_};
  transfer_interceptor_ = std::move(interceptor);
}

void in_memory_ledger::set_charge_interceptor(
    charge_interceptor_t interceptor) {
  auto lock = std::scoped_lock{mutex_};
  charge_interceptor_ = std::move(interceptor);
}

lockbox::execution::ports in_memory_ledger::make_ports() {
  auto result = lockbox::execution::ports{};
  result.associate = [this](const account_id_t& account,
                            const asset_type_id_t& asset_type) {
    return associate(account, asset_type);
  };
  result.transfer = [this](const asset_type_id_t& asset_type,
                           const serial_number_t& serial_number,
                           const account_id_t& from, const account_id_t& to) {
    return transfer(asset_type, serial_number, from, to);
  };
  result.fee_balance = [this](const account_id_t& account) {
    return fee_balance(account);
  };
  result.charge_fee = [this](const account_id_t& payer,
                             const account_id_t& collector,
                             const amount_t& amount) {
    return charge_fee(payer, collector, amount);
  };
  result.asset_info = [this](const asset_type_id_t& asset_type) {
    return asset_info(asset_type);
  };
  return result;
}

}  // namespace lockbox::ledger
