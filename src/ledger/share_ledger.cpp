#include <sharevault/ledger/share_ledger.hpp>

#include <limits>

using namespace sharevault::schema;

namespace sharevault::ledger {

namespace {

bool would_overflow(const amount_t& lhs, const amount_t& rhs) {
  return lhs > std::numeric_limits<amount_t>::max() - rhs;
}

}  // namespace

share_ledger::share_ledger(share_ledger_state_t& state) : state_{state} {}

bool share_ledger::is_registered(const account_id_t& account) const {
  return state_.balances.contains(account);
}

amount_t share_ledger::balance_of(const account_id_t& account) const {
  auto it = state_.balances.find(account);
  return it == std::end(state_.balances) ? amount_t{0} : it->second;
}

const amount_t& share_ledger::total_supply() const {
  return state_.total_supply;
}

const amount_t& share_ledger::locked() const {
  return state_.locked;
}

bool share_ledger::register_account(const account_id_t& account) {
  return state_.balances.emplace(account, amount_t{0}).second;
}

error_code share_ledger::deposit(const account_id_t& account,
                                 const amount_t& amount) {
  if (amount == 0) {
    return error_code::invalid_amount;
  }
  auto it = state_.balances.find(account);
  if (it == std::end(state_.balances)) {
    return error_code::account_not_registered;
  }
  if (would_overflow(it->second, amount) ||
      would_overflow(state_.total_supply, amount)) {
    return error_code::arithmetic_overflow;
  }
  it->second += amount;
  state_.total_supply += amount;
  return error_code::ok;
}

error_code share_ledger::withdraw(const account_id_t& account,
                                  const amount_t& amount) {
  if (amount == 0) {
    return error_code::invalid_amount;
  }
  auto it = state_.balances.find(account);
  if (it == std::end(state_.balances)) {
    return error_code::account_not_registered;
  }
  if (it->second < amount) {
    return error_code::insufficient_balance;
  }
  if (state_.total_supply < amount) {
    return error_code::supply_underflow;
  }
  it->second -= amount;
  state_.total_supply -= amount;
  return error_code::ok;
}

error_code share_ledger::transfer(const account_id_t& sender,
                                  const account_id_t& receiver,
                                  const amount_t& amount) {
  if (amount == 0) {
    return error_code::invalid_amount;
  }
  if (sender == receiver) {
    return error_code::self_transfer;
  }
  auto from = state_.balances.find(sender);
  auto to = state_.balances.find(receiver);
  if (from == std::end(state_.balances) || to == std::end(state_.balances)) {
    return error_code::account_not_registered;
  }
  if (from->second < amount) {
    return error_code::insufficient_balance;
  }
  if (would_overflow(to->second, amount)) {
    return error_code::arithmetic_overflow;
  }
  from->second -= amount;
  to->second += amount;
  return error_code::ok;
}

error_code share_ledger::lock(const account_id_t& account,
                              const amount_t& amount) {
  if (amount == 0) {
    return error_code::invalid_amount;
  }
  auto it = state_.balances.find(account);
  if (it == std::end(state_.balances)) {
    return error_code::account_not_registered;
  }
  if (it->second < amount) {
    return error_code::insufficient_balance;
  }
  it->second -= amount;
  state_.locked += amount;
  return error_code::ok;
}

error_code share_ledger::unlock(const account_id_t& account,
                                const amount_t& amount) {
  if (amount == 0) {
    return error_code::invalid_amount;
  }
  if (state_.locked < amount) {
    return error_code::insufficient_balance;
  }
  // A closed account is re-registered so returned shares are never lost.
  auto [it, inserted] = state_.balances.emplace(account, amount_t{0});
  static_cast<void>(inserted);
  if (would_overflow(it->second, amount)) {
    return error_code::arithmetic_overflow;
  }
  state_.locked -= amount;
  it->second += amount;
  return error_code::ok;
}

error_code share_ledger::burn_locked(const amount_t& amount) {
  if (amount == 0) {
    return error_code::invalid_amount;
  }
  if (state_.locked < amount) {
    return error_code::insufficient_balance;
  }
  if (state_.total_supply < amount) {
    return error_code::supply_underflow;
  }
  state_.locked -= amount;
  state_.total_supply -= amount;
  return error_code::ok;
}

error_code share_ledger::close_account(const account_id_t& account,
                                       const bool force,
                                       amount_t& burned) {
  auto it = state_.balances.find(account);
  if (it == std::end(state_.balances)) {
    return error_code::account_not_registered;
  }
  if (it->second > 0 && !force) {
    return error_code::nonzero_balance;
  }
  burned = it->second;
  state_.total_supply -= burned;
  state_.balances.erase(it);
  return error_code::ok;
}

bool share_ledger::is_consistent() const {
  auto sum = state_.locked;
  for (const auto& [account, balance] : state_.balances) {
    static_cast<void>(account);
    if (would_overflow(sum, balance)) {
      return false;
    }
    sum += balance;
  }
  return sum == state_.total_supply;
}

}  // namespace sharevault::ledger
