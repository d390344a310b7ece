#pragma once

#include <sharevault/schema/primitives.hpp>

namespace sharevault::contracts {

using sharevault::schema::kTeraGas;

inline constexpr sharevault::schema::gas_t kInfoCallGas{5 * kTeraGas};
inline constexpr sharevault::schema::gas_t kInfoCallbackGas{5 * kTeraGas};
inline constexpr sharevault::schema::gas_t kTransferGas{10 * kTeraGas};
// Covers returning a foreign asset to its owner.
inline constexpr sharevault::schema::gas_t kTransferCallbackGas{15 * kTeraGas};
// Covers requesting the outgoing leg of a swap and its resumption.
inline constexpr sharevault::schema::gas_t kSwapCallbackGas{30 * kTeraGas};
inline constexpr sharevault::schema::gas_t kFtOnTransferGas{10 * kTeraGas};
inline constexpr sharevault::schema::gas_t kFtResolveTransferGas{5 * kTeraGas};
inline constexpr sharevault::schema::gas_t kCreationCallbackGas{10 * kTeraGas};
inline constexpr sharevault::schema::gas_t kParamsForwardGas{10 * kTeraGas};

/// Shares minted per deposited asset for a new vault.
inline const sharevault::schema::amount_t kDefaultUnitValue =
    100 * sharevault::schema::kWholeUnit;

/// Native units granted to a vault account when it is provisioned.
inline const sharevault::schema::amount_t kDefaultVaultFunding =
    25 * sharevault::schema::kWholeUnit;

/// Security deposit attached to asset and share transfers.
inline const sharevault::schema::amount_t kOneUnitDeposit{1};

}  // namespace sharevault::contracts
