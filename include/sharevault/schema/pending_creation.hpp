#pragma once
#include <sharevault/schema/creation_status.hpp>
#include <sharevault/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: pending creation.
// Registry saga record held between issuing a vault provisioning batch and
// its confirmation.
namespace sharevault::schema {

template <uint16_t Version>
struct pending_creation;

template <>
struct pending_creation<1> final {
  uint16_t version{1};
  account_id_t origin;
  account_id_t vault_address;
  std::string name;
  std::string symbol;
  std::string media;
  creation_status_t status{creation_status_t::pending};
  std::string failure;
  int64_t created_height{};
};

using pending_creation_t = pending_creation<1>;

}  // namespace sharevault::schema
