#pragma once
#include <sharevault/schema/intent_kind.hpp>
#include <sharevault/schema/intent_status.hpp>
#include <sharevault/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: settlement intent.
// Saga record for one deposit, withdraw or swap. Each leg is one asset
// transfer; `inbound` legs move an asset into vault custody, outbound legs
// move one out to the intent's account.
namespace sharevault::schema {

template <uint16_t Version>
struct settlement_leg;

template <>
struct settlement_leg<1> final {
  uint16_t version{1};
  asset_id_t asset_id;
  bool inbound{};
  intent_status_t status{intent_status_t::pending};
  std::string failure;
};

using settlement_leg_t = settlement_leg<1>;

template <uint16_t Version>
struct settlement_intent;

template <>
struct settlement_intent<1> final {
  uint16_t version{1};
  uint64_t intent_id{};
  intent_kind_t kind{intent_kind_t::deposit};
  account_id_t account;
  std::vector<settlement_leg_t> legs;
  amount_t shares_per_leg{};
  intent_status_t status{intent_status_t::pending};
  int64_t created_height{};
};

using settlement_intent_t = settlement_intent<1>;

}  // namespace sharevault::schema
