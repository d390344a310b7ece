#pragma once

#include <sharevault/runtime/component.hpp>
#include <sharevault/runtime/modes.hpp>
#include <sharevault/schema/registry_state.hpp>
#include <sharevault/schema/vault_record.hpp>
#include <optional>
#include <string_view>

namespace sharevault::contracts {

struct registry_options final {
  runtime::record_commit_mode_t record_commit_mode{
      runtime::record_commit_mode_t::confirmed};
  runtime::remote_failure_policy_t failure_policy{
      runtime::remote_failure_policy_t::propagate};
  sharevault::schema::amount_t vault_funding{};
};

/// Creates one vault per asset origin and aggregates their public info.
class registry final
    : public runtime::stateful_component<sharevault::schema::registry_state_t> {
 public:
  explicit registry(registry_options options);

  sharevault::schema::component_kind_t kind() const override;

 protected:
  runtime::call_outcome execute(runtime::call_context& context,
                                const sharevault::schema::method_call_t& call,
                                sharevault::schema::registry_state_t& state)
      override;

 private:
  runtime::call_outcome create_vault(
      runtime::call_context& context,
      const sharevault::schema::create_vault_t& args,
      sharevault::schema::registry_state_t& state);
  runtime::call_outcome request_info(
      runtime::call_context& context,
      uint64_t index,
      const sharevault::schema::registry_state_t& state);
  runtime::call_outcome refresh_all(runtime::call_context& context,
                                    sharevault::schema::registry_state_t& state);
  runtime::call_outcome set_vault_params(
      runtime::call_context& context,
      const sharevault::schema::set_vault_params_t& args,
      const sharevault::schema::registry_state_t& state);
  runtime::call_outcome on_vault_created(
      runtime::call_context& context,
      const sharevault::schema::on_vault_created_t& args,
      sharevault::schema::registry_state_t& state);
  runtime::call_outcome on_vault_info(
      runtime::call_context& context,
      const sharevault::schema::on_vault_info_t& args,
      sharevault::schema::registry_state_t& state);

  registry_options options_;
};

/// `lower(replace(symbol, '.', '-')) + "." + registry`.
sharevault::schema::account_id_t derive_vault_address(
    std::string_view symbol,
    std::string_view registry_account);

/// Append the next vault record to both lookup tables.
sharevault::schema::vault_record_t append_record(
    sharevault::schema::registry_state_t& state,
    const sharevault::schema::account_id_t& origin,
    const sharevault::schema::account_id_t& vault_address);

std::optional<sharevault::schema::account_id_t> vault_address_by_index(
    const sharevault::schema::registry_state_t& state,
    uint64_t index);

}  // namespace sharevault::contracts
