#pragma once
#include <sharevault/schema/primitives.hpp>
#include <optional>
#include <string>

// Vault call: move shares to a component and notify it with `msg`. Shares
// the receiver reports as unused are refunded once it answers.
namespace sharevault::schema {

template <uint16_t Version>
struct ft_transfer_call;

template <>
struct ft_transfer_call<1> final {
  uint16_t version{1};
  account_id_t receiver;
  amount_t amount{};
  std::optional<std::string> memo;
  std::string msg;
};

using ft_transfer_call_t = ft_transfer_call<1>;

}  // namespace sharevault::schema
