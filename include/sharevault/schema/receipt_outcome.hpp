#pragma once

#include <sharevault/schema/primitives.hpp>
#include <sharevault/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: receipt outcome.
// Result of executing one receipt. Persisted by receipt id so callers can
// observe the typed outcome of a remote step or a callback.
namespace sharevault::schema {

template <uint16_t Version>
struct receipt_outcome;

template <>
struct receipt_outcome<1> final {
  uint16_t version{1};
  uint64_t receipt_id{};
  account_id_t predecessor;
  account_id_t receiver;
  std::string method;
  uint32_t code{};
  std::string log;
  bytes_t data;
  gas_t gas_used{};
  int64_t height{};
  std::vector<transaction_event_t> events;
};

using receipt_outcome_t = receipt_outcome<1>;

}  // namespace sharevault::schema
