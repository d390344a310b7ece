#pragma once
#include <sharevault/schema/primitives.hpp>

// Schema type: create vault.
// Registry call: provision a vault for an asset origin that has none yet.
namespace sharevault::schema {

template <uint16_t Version>
struct create_vault;

template <>
struct create_vault<1> final {
  uint16_t version{1};
  std::string name;
  account_id_t origin;
  std::string symbol;
  std::string media;
};

using create_vault_t = create_vault<1>;

}  // namespace sharevault::schema
