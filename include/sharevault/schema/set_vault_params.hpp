#pragma once
#include <sharevault/schema/primitives.hpp>

// Schema type: set vault params.
// Registry call (administrator only): forward a parameter update to a vault.
namespace sharevault::schema {

template <uint16_t Version>
struct set_vault_params;

template <>
struct set_vault_params<1> final {
  uint16_t version{1};
  account_id_t vault;
  std::string name;
  std::string symbol;
  amount_t unit_value{};
  std::string media;
};

using set_vault_params_t = set_vault_params<1>;

}  // namespace sharevault::schema
