#pragma once
#include <sharevault/schema/primitives.hpp>
#include <optional>

// Vault call: register an account with the share ledger.
namespace sharevault::schema {

template <uint16_t Version>
struct storage_deposit;

template <>
struct storage_deposit<1> final {
  uint16_t version{1};
  std::optional<account_id_t> account;
};

using storage_deposit_t = storage_deposit<1>;

}  // namespace sharevault::schema
