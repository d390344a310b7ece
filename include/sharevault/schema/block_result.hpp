#pragma once

#include <sharevault/schema/primitives.hpp>
#include <sharevault/schema/receipt_outcome.hpp>
#include <sharevault/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

// Schema type: block result.
// Finalize output: per-transaction results, outcomes of the receipts that
// became ready in this block, and the candidate post-block state root.
namespace sharevault::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  std::vector<transaction_result_t> tx_results;
  std::vector<receipt_outcome_t> receipt_outcomes;
  hash32_t state_root{};
};

using block_result_t = block_result<1>;

}  // namespace sharevault::schema
