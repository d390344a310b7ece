#pragma once
#include <sharevault/schema/primitives.hpp>

// Vault call (registry only): overwrite metadata and the exchange rate.
namespace sharevault::schema {

template <uint16_t Version>
struct set_params;

template <>
struct set_params<1> final {
  uint16_t version{1};
  std::string name;
  std::string symbol;
  amount_t unit_value{};
  std::string media;
};

using set_params_t = set_params<1>;

}  // namespace sharevault::schema
