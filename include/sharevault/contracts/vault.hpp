#pragma once

#include <sharevault/contracts/constants.hpp>
#include <sharevault/runtime/component.hpp>
#include <sharevault/runtime/modes.hpp>
#include <sharevault/schema/error_code.hpp>
#include <sharevault/schema/public_vault_info.hpp>
#include <sharevault/schema/storage_balance.hpp>
#include <sharevault/schema/vault_state.hpp>
#include <optional>
#include <vector>

namespace sharevault::contracts {

struct vault_options final {
  runtime::settlement_mode_t settlement_mode{
      runtime::settlement_mode_t::confirmed};
  runtime::remote_failure_policy_t failure_policy{
      runtime::remote_failure_policy_t::propagate};
};

/// Custody unit for one asset origin.
///
/// Deposited assets mint `unit_value` shares each; withdrawing an asset
/// burns the same amount. Asset movements are requests to the origin's
/// asset registry that resolve in later blocks; in confirmed settlement mode
/// each one is tracked as a leg of a settlement intent and the ledger only
/// changes when the leg's outcome arrives.
class vault final
    : public runtime::stateful_component<sharevault::schema::vault_state_t> {
 public:
  explicit vault(vault_options options = {});

  sharevault::schema::component_kind_t kind() const override;

 protected:
  runtime::call_outcome execute(runtime::call_context& context,
                                const sharevault::schema::method_call_t& call,
                                sharevault::schema::vault_state_t& state)
      override;

 private:
  runtime::call_outcome init(runtime::call_context& context,
                             const sharevault::schema::init_vault_t& args,
                             sharevault::schema::vault_state_t& state);
  runtime::call_outcome deposit(
      runtime::call_context& context,
      const std::vector<sharevault::schema::asset_id_t>& assets,
      sharevault::schema::vault_state_t& state);
  runtime::call_outcome withdraw(
      runtime::call_context& context,
      const std::vector<sharevault::schema::asset_id_t>& assets,
      sharevault::schema::vault_state_t& state);
  runtime::call_outcome swap(runtime::call_context& context,
                             const sharevault::schema::swap_t& args,
                             sharevault::schema::vault_state_t& state);
  runtime::call_outcome set_params(runtime::call_context& context,
                                   const sharevault::schema::set_params_t& args,
                                   sharevault::schema::vault_state_t& state);
  runtime::call_outcome ft_transfer(
      runtime::call_context& context,
      const sharevault::schema::ft_transfer_t& args,
      sharevault::schema::vault_state_t& state);
  runtime::call_outcome ft_transfer_call(
      runtime::call_context& context,
      const sharevault::schema::ft_transfer_call_t& args,
      sharevault::schema::vault_state_t& state);
  runtime::call_outcome ft_resolve_transfer(
      runtime::call_context& context,
      const sharevault::schema::ft_resolve_transfer_t& args,
      sharevault::schema::vault_state_t& state);
  runtime::call_outcome storage_deposit(
      runtime::call_context& context,
      const sharevault::schema::storage_deposit_t& args,
      sharevault::schema::vault_state_t& state);
  runtime::call_outcome storage_unregister(
      runtime::call_context& context,
      const sharevault::schema::storage_unregister_t& args,
      sharevault::schema::vault_state_t& state);
  runtime::call_outcome storage_withdraw(
      runtime::call_context& context,
      const sharevault::schema::storage_withdraw_t& args,
      sharevault::schema::vault_state_t& state);
  runtime::call_outcome on_transfer_settled(
      runtime::call_context& context,
      const sharevault::schema::on_transfer_settled_t& args,
      sharevault::schema::vault_state_t& state);

  /// Queue one asset transfer leg, with a resumption in confirmed mode.
  bool request_transfer(runtime::call_context& context,
                        const sharevault::schema::vault_state_t& state,
                        const sharevault::schema::asset_id_t& asset,
                        const sharevault::schema::account_id_t& receiver,
                        uint64_t intent_id,
                        sharevault::schema::gas_t callback_gas =
                            kTransferCallbackGas);
  /// Send an asset that arrived from the wrong owner back, unconditionally.
  bool return_asset(runtime::call_context& context,
                    const sharevault::schema::vault_state_t& state,
                    const sharevault::schema::asset_id_t& asset,
                    const sharevault::schema::account_id_t& owner);

  vault_options options_;
};

/// The vault's public view. Fails with `supply_underflow` when the total
/// supply is below one unit value and `not_initialized` before init.
sharevault::schema::error_code make_public_info(
    const sharevault::schema::vault_state_t& state,
    sharevault::schema::public_vault_info_t& info);

/// Registration with a vault is free, so a registered account always holds
/// a zero storage balance. Empty when `account` is not registered.
std::optional<sharevault::schema::storage_balance_t> make_storage_balance(
    const sharevault::schema::vault_state_t& state,
    const sharevault::schema::account_id_t& account);

sharevault::schema::storage_balance_bounds_t make_storage_balance_bounds();

}  // namespace sharevault::contracts
