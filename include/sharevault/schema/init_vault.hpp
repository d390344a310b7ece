#pragma once
#include <sharevault/schema/primitives.hpp>

// Schema type: init vault.
// Vault constructor, invoked once by the registry that provisioned it.
namespace sharevault::schema {

template <uint16_t Version>
struct init_vault;

template <>
struct init_vault<1> final {
  uint16_t version{1};
  account_id_t origin;
  std::string name;
  std::string symbol;
  std::string media;
};

using init_vault_t = init_vault<1>;

}  // namespace sharevault::schema
