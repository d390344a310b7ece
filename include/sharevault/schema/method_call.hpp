#pragma once
#include <sharevault/schema/batch_deposit.hpp>
#include <sharevault/schema/batch_withdraw.hpp>
#include <sharevault/schema/create_vault.hpp>
#include <sharevault/schema/deposit.hpp>
#include <sharevault/schema/ft_on_transfer.hpp>
#include <sharevault/schema/ft_resolve_transfer.hpp>
#include <sharevault/schema/ft_transfer.hpp>
#include <sharevault/schema/ft_transfer_call.hpp>
#include <sharevault/schema/get_info.hpp>
#include <sharevault/schema/get_vault_info_by_index.hpp>
#include <sharevault/schema/init_vault.hpp>
#include <sharevault/schema/nft_approve.hpp>
#include <sharevault/schema/nft_mint.hpp>
#include <sharevault/schema/nft_transfer.hpp>
#include <sharevault/schema/on_transfer_settled.hpp>
#include <sharevault/schema/on_vault_created.hpp>
#include <sharevault/schema/on_vault_info.hpp>
#include <sharevault/schema/refresh_all.hpp>
#include <sharevault/schema/set_fee.hpp>
#include <sharevault/schema/set_params.hpp>
#include <sharevault/schema/set_vault_params.hpp>
#include <sharevault/schema/storage_deposit.hpp>
#include <sharevault/schema/storage_unregister.hpp>
#include <sharevault/schema/storage_withdraw.hpp>
#include <sharevault/schema/swap.hpp>
#include <sharevault/schema/withdraw.hpp>
#include <string_view>
#include <variant>

namespace sharevault::schema {

/// Every method a component can be invoked with, whether directly by a
/// transaction or through a receipt.
using method_call_t = std::variant<create_vault_t,
                                   get_vault_info_by_index_t,
                                   refresh_all_t,
                                   set_vault_params_t,
                                   set_fee_t,
                                   on_vault_created_t,
                                   on_vault_info_t,
                                   init_vault_t,
                                   get_info_t,
                                   deposit_t,
                                   batch_deposit_t,
                                   withdraw_t,
                                   batch_withdraw_t,
                                   swap_t,
                                   set_params_t,
                                   ft_transfer_t,
                                   storage_deposit_t,
                                   storage_unregister_t,
                                   on_transfer_settled_t,
                                   nft_mint_t,
                                   nft_approve_t,
                                   nft_transfer_t,
                                   ft_transfer_call_t,
                                   ft_on_transfer_t,
                                   ft_resolve_transfer_t,
                                   storage_withdraw_t>;

/// Stable method name, used in receipt outcomes, events and logs.
std::string_view method_name(const method_call_t& call);

}  // namespace sharevault::schema
