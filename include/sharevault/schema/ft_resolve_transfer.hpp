#pragma once
#include <sharevault/schema/primitives.hpp>

// Vault resumption of `ft_transfer_call`.
namespace sharevault::schema {

template <uint16_t Version>
struct ft_resolve_transfer;

template <>
struct ft_resolve_transfer<1> final {
  uint16_t version{1};
  account_id_t sender;
  account_id_t receiver;
  amount_t amount{};
};

using ft_resolve_transfer_t = ft_resolve_transfer<1>;

}  // namespace sharevault::schema
