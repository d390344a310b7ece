#pragma once
#include <sharevault/schema/primitives.hpp>

// Schema type: swap.
// Vault call: exchange one asset for another held in custody at a fixed
// 1:1 rate. The ledger is not touched.
namespace sharevault::schema {

template <uint16_t Version>
struct swap;

template <>
struct swap<1> final {
  uint16_t version{1};
  asset_id_t asset_in;
  asset_id_t asset_out;
};

using swap_t = swap<1>;

}  // namespace sharevault::schema
