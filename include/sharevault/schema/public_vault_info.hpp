#pragma once
#include <sharevault/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: public vault info.
// What a vault reports about itself. `reported_supply` excludes the
// permanent seed unit held by the vault.
namespace sharevault::schema {

template <uint16_t Version>
struct public_vault_info;

template <>
struct public_vault_info<1> final {
  uint16_t version{1};
  std::string name;
  std::string symbol;
  amount_t reported_supply{};
  std::string media;
};

using public_vault_info_t = public_vault_info<1>;

}  // namespace sharevault::schema
