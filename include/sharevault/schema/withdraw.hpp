#pragma once
#include <sharevault/schema/primitives.hpp>

// Vault call: redeem unit_value shares for one asset out of custody.
namespace sharevault::schema {

template <uint16_t Version>
struct withdraw;

template <>
struct withdraw<1> final {
  uint16_t version{1};
  asset_id_t asset_id;
};

using withdraw_t = withdraw<1>;

}  // namespace sharevault::schema
