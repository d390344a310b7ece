#pragma once

#include <sharevault/schema/error_code.hpp>
#include <sharevault/schema/primitives.hpp>
#include <sharevault/schema/share_ledger_state.hpp>

namespace sharevault::ledger {

/// Fungible share accounting over a borrowed `share_ledger_state_t`.
///
/// Every operation either succeeds and preserves
/// `total_supply == sum(balances) + locked`, or fails with an error code and
/// leaves the state untouched.
class share_ledger final {
 public:
  explicit share_ledger(sharevault::schema::share_ledger_state_t& state);

  bool is_registered(const sharevault::schema::account_id_t& account) const;

  /// Zero for unregistered accounts.
  sharevault::schema::amount_t balance_of(
      const sharevault::schema::account_id_t& account) const;
  const sharevault::schema::amount_t& total_supply() const;
  const sharevault::schema::amount_t& locked() const;

  /// Returns true when the account was not registered before.
  bool register_account(const sharevault::schema::account_id_t& account);

  /// Mint `amount` to a registered account.
  sharevault::schema::error_code deposit(
      const sharevault::schema::account_id_t& account,
      const sharevault::schema::amount_t& amount);

  /// Burn `amount` from a registered account.
  sharevault::schema::error_code withdraw(
      const sharevault::schema::account_id_t& account,
      const sharevault::schema::amount_t& amount);

  sharevault::schema::error_code transfer(
      const sharevault::schema::account_id_t& sender,
      const sharevault::schema::account_id_t& receiver,
      const sharevault::schema::amount_t& amount);

  /// Move `amount` from the account's balance into escrow.
  sharevault::schema::error_code lock(
      const sharevault::schema::account_id_t& account,
      const sharevault::schema::amount_t& amount);

  /// Return escrowed shares to the account's balance.
  sharevault::schema::error_code unlock(
      const sharevault::schema::account_id_t& account,
      const sharevault::schema::amount_t& amount);

  /// Destroy escrowed shares.
  sharevault::schema::error_code burn_locked(
      const sharevault::schema::amount_t& amount);

  /// Unregister an account. A positive balance is rejected unless `force`
  /// is set, in which case it is burned and reported through `burned`.
  sharevault::schema::error_code close_account(
      const sharevault::schema::account_id_t& account,
      bool force,
      sharevault::schema::amount_t& burned);

  bool is_consistent() const;

 private:
  sharevault::schema::share_ledger_state_t& state_;
};

}  // namespace sharevault::ledger
