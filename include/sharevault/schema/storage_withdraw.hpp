#pragma once
#include <sharevault/schema/primitives.hpp>
#include <optional>

// Vault call: withdraw from the caller's available storage balance.
namespace sharevault::schema {

template <uint16_t Version>
struct storage_withdraw;

template <>
struct storage_withdraw<1> final {
  uint16_t version{1};
  std::optional<amount_t> amount;
};

using storage_withdraw_t = storage_withdraw<1>;

}  // namespace sharevault::schema
