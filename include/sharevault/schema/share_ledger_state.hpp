#pragma once
#include <sharevault/schema/primitives.hpp>
#include <cstdint>
#include <map>

// Schema type: share ledger state.
// `total_supply` always equals the sum of `balances` plus `locked`.
namespace sharevault::schema {

template <uint16_t Version>
struct share_ledger_state;

template <>
struct share_ledger_state<1> final {
  uint16_t version{1};
  std::map<account_id_t, amount_t> balances;
  amount_t total_supply{};
  amount_t locked{};
};

using share_ledger_state_t = share_ledger_state<1>;

}  // namespace sharevault::schema
