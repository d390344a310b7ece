#pragma once
#include <sharevault/schema/primitives.hpp>

// Vault call: lock one asset into custody for unit_value shares.
namespace sharevault::schema {

template <uint16_t Version>
struct deposit;

template <>
struct deposit<1> final {
  uint16_t version{1};
  asset_id_t asset_id;
};

using deposit_t = deposit<1>;

}  // namespace sharevault::schema
