#pragma once

#include <cstdint>
#include <string_view>

// Schema type: error code.
// Result codes shared by transaction results and receipt outcomes. Zero is
// success; codes are stable because they are persisted with outcomes.
namespace sharevault::schema {

enum class error_code : uint32_t {
  ok = 0,
  // Transaction admission.
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_account_id = 5,
  signer_key_missing = 6,
  invalid_signature = 7,
  invalid_block_height = 8,
  // Host / receipt execution.
  account_missing = 10,
  account_exists = 11,
  component_missing = 12,
  method_not_found = 13,
  gas_exhausted = 14,
  insufficient_funds = 15,
  not_a_callback = 16,
  deposit_required = 17,
  // Authorization.
  unauthorized = 20,
  // Preconditions.
  already_initialized = 30,
  not_initialized = 31,
  origin_already_registered = 32,
  vault_creation_pending = 33,
  vault_exists = 34,
  vault_not_found = 35,
  account_not_registered = 36,
  insufficient_balance = 37,
  invalid_amount = 38,
  invalid_unit_value = 39,
  invalid_metadata = 40,
  empty_batch = 41,
  duplicate_asset = 42,
  intent_missing = 43,
  asset_missing = 44,
  asset_exists = 45,
  asset_not_owned = 46,
  approval_mismatch = 47,
  self_transfer = 48,
  nonzero_balance = 49,
  // Arithmetic bounds.
  supply_underflow = 60,
  arithmetic_overflow = 61,
  // Remote steps.
  remote_step_failed = 70,
  remote_step_pending = 71,
};

inline constexpr std::string_view describe(const error_code code) {
  switch (code) {
    case error_code::ok:
      return "ok";
    case error_code::invalid_transaction:
      return "invalid transaction";
    case error_code::unsupported_transaction_version:
      return "unsupported transaction version";
    case error_code::invalid_chain_id:
      return "invalid chain id";
    case error_code::invalid_nonce:
      return "invalid nonce";
    case error_code::invalid_account_id:
      return "invalid account id";
    case error_code::signer_key_missing:
      return "signer has no public key";
    case error_code::invalid_signature:
      return "invalid signature";
    case error_code::invalid_block_height:
      return "block height is not above the last finalized height";
    case error_code::account_missing:
      return "account not found";
    case error_code::account_exists:
      return "account already exists";
    case error_code::component_missing:
      return "no component deployed on account";
    case error_code::method_not_found:
      return "method not found";
    case error_code::gas_exhausted:
      return "exceeded prepaid gas";
    case error_code::insufficient_funds:
      return "insufficient native balance";
    case error_code::not_a_callback:
      return "callback invoked outside of a resumption";
    case error_code::deposit_required:
      return "requires an attached deposit of exactly one unit";
    case error_code::unauthorized:
      return "unauthorized";
    case error_code::already_initialized:
      return "already initialized";
    case error_code::not_initialized:
      return "not initialized";
    case error_code::origin_already_registered:
      return "origin already registered";
    case error_code::vault_creation_pending:
      return "vault creation already pending for origin";
    case error_code::vault_exists:
      return "vault address already in use";
    case error_code::vault_not_found:
      return "not found";
    case error_code::account_not_registered:
      return "account is not registered";
    case error_code::insufficient_balance:
      return "share balance is smaller than the requested value";
    case error_code::invalid_amount:
      return "amount must be positive";
    case error_code::invalid_unit_value:
      return "unit value must be positive";
    case error_code::invalid_metadata:
      return "invalid fungible metadata";
    case error_code::empty_batch:
      return "batch is empty";
    case error_code::duplicate_asset:
      return "asset listed more than once";
    case error_code::intent_missing:
      return "settlement intent not found";
    case error_code::asset_missing:
      return "asset not found";
    case error_code::asset_exists:
      return "asset already exists";
    case error_code::asset_not_owned:
      return "sender does not own or is not approved for asset";
    case error_code::approval_mismatch:
      return "approval id does not match";
    case error_code::self_transfer:
      return "sender and receiver must differ";
    case error_code::nonzero_balance:
      return "account has a positive balance";
    case error_code::supply_underflow:
      return "total supply is below one unit value";
    case error_code::arithmetic_overflow:
      return "arithmetic overflow";
    case error_code::remote_step_failed:
      return "remote step failed";
    case error_code::remote_step_pending:
      return "remote step not yet resolved";
  }
  return "unknown";
}

}  // namespace sharevault::schema
