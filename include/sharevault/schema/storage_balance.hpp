#pragma once
#include <sharevault/schema/primitives.hpp>
#include <optional>

// Schema type: storage balance.
// Registration bond an account holds with a vault's share ledger, and the
// bounds a registration must fall within.
namespace sharevault::schema {

template <uint16_t Version>
struct storage_balance;

template <>
struct storage_balance<1> final {
  uint16_t version{1};
  amount_t total{};
  amount_t available{};
};

using storage_balance_t = storage_balance<1>;

template <uint16_t Version>
struct storage_balance_bounds;

template <>
struct storage_balance_bounds<1> final {
  uint16_t version{1};
  amount_t min{};
  std::optional<amount_t> max;
};

using storage_balance_bounds_t = storage_balance_bounds<1>;

}  // namespace sharevault::schema
