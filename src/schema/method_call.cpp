#include <sharevault/schema/method_call.hpp>

namespace sharevault::schema {

std::string_view method_name(const method_call_t& call) {
  return std::visit(
      overloaded{
          [](const create_vault_t&) -> std::string_view {
            return "create_vault";
          },
          [](const get_vault_info_by_index_t&) -> std::string_view {
            return "get_vault_info_by_index";
          },
          [](const refresh_all_t&) -> std::string_view {
            return "refresh_all";
          },
          [](const set_vault_params_t&) -> std::string_view {
            return "set_vault_params";
          },
          [](const set_fee_t&) -> std::string_view { return "set_fee"; },
          [](const on_vault_created_t&) -> std::string_view {
            return "on_vault_created";
          },
          [](const on_vault_info_t&) -> std::string_view {
            return "on_vault_info";
          },
          [](const init_vault_t&) -> std::string_view { return "init_vault"; },
          [](const get_info_t&) -> std::string_view { return "get_info"; },
          [](const deposit_t&) -> std::string_view { return "deposit"; },
          [](const batch_deposit_t&) -> std::string_view {
            return "batch_deposit";
          },
          [](const withdraw_t&) -> std::string_view { return "withdraw"; },
          [](const batch_withdraw_t&) -> std::string_view {
            return "batch_withdraw";
          },
          [](const swap_t&) -> std::string_view { return "swap"; },
          [](const set_params_t&) -> std::string_view { return "set_params"; },
          [](const ft_transfer_t&) -> std::string_view {
            return "ft_transfer";
          },
          [](const storage_deposit_t&) -> std::string_view {
            return "storage_deposit";
          },
          [](const storage_unregister_t&) -> std::string_view {
            return "storage_unregister";
          },
          [](const on_transfer_settled_t&) -> std::string_view {
            return "on_transfer_settled";
          },
          [](const nft_mint_t&) -> std::string_view { return "nft_mint"; },
          [](const nft_approve_t&) -> std::string_view {
            return "nft_approve";
          },
          [](const nft_transfer_t&) -> std::string_view {
            return "nft_transfer";
          },
          [](const ft_transfer_call_t&) -> std::string_view {
            return "ft_transfer_call";
          },
          [](const ft_on_transfer_t&) -> std::string_view {
            return "ft_on_transfer";
          },
          [](const ft_resolve_transfer_t&) -> std::string_view {
            return "ft_resolve_transfer";
          },
          [](const storage_withdraw_t&) -> std::string_view {
            return "storage_withdraw";
          }},
      call);
}

}  // namespace sharevault::schema
