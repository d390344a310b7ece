#pragma once
#include <sharevault/schema/pending_creation.hpp>
#include <sharevault/schema/primitives.hpp>
#include <sharevault/schema/public_vault_info.hpp>
#include <cstdint>
#include <map>
#include <string>

// Schema type: registry state.
// `index_to_origin` and `origin_to_vault` always describe the same set of
// vault records; `counter` is the next index to assign.
namespace sharevault::schema {

template <uint16_t Version>
struct registry_state;

template <>
struct registry_state<1> final {
  uint16_t version{1};
  bool initialized{};
  account_id_t owner;
  uint64_t counter{};
  amount_t fee{};
  std::map<uint64_t, account_id_t> index_to_origin;
  std::map<account_id_t, account_id_t> origin_to_vault;
  std::map<uint64_t, public_vault_info_t> info_cache;
  std::map<uint64_t, std::string> info_failures;
  std::map<account_id_t, pending_creation_t> pending_creations;
};

using registry_state_t = registry_state<1>;

}  // namespace sharevault::schema
