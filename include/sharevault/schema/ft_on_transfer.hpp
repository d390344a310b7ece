#pragma once
#include <sharevault/schema/primitives.hpp>
#include <string>

// Notification a share receiver handles after `ft_transfer_call`. A
// successful answer carries the unused amount as a SCALE `amount_t`.
namespace sharevault::schema {

template <uint16_t Version>
struct ft_on_transfer;

template <>
struct ft_on_transfer<1> final {
  uint16_t version{1};
  account_id_t sender;
  amount_t amount{};
  std::string msg;
};

using ft_on_transfer_t = ft_on_transfer<1>;

}  // namespace sharevault::schema
