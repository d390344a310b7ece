#pragma once
#include <sharevault/schema/fungible_metadata.hpp>
#include <sharevault/schema/primitives.hpp>
#include <sharevault/schema/settlement_intent.hpp>
#include <sharevault/schema/share_ledger_state.hpp>
#include <cstdint>
#include <map>
#include <string>

// Schema type: vault state.
// Persisted state of one vault component.
namespace sharevault::schema {

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  uint16_t version{1};
  bool initialized{};
  account_id_t origin;
  account_id_t registry;
  amount_t unit_value{};
  std::string name;
  std::string symbol;
  std::string media;
  fungible_metadata_t metadata;
  share_ledger_state_t ledger;
  std::map<uint64_t, settlement_intent_t> intents;
  uint64_t next_intent_id{};
};

using vault_state_t = vault_state<1>;

}  // namespace sharevault::schema
