#pragma once
#include <sharevault/schema/primitives.hpp>
#include <optional>

namespace sharevault::schema {

template <uint16_t Version>
struct ft_transfer;

template <>
struct ft_transfer<1> final {
  uint16_t version{1};
  account_id_t receiver;
  amount_t amount{};
  std::optional<std::string> memo;
};

using ft_transfer_t = ft_transfer<1>;

}  // namespace sharevault::schema
