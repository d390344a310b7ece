#pragma once
#include <sharevault/schema/primitives.hpp>
#include <vector>

namespace sharevault::schema {

template <uint16_t Version>
struct batch_withdraw;

template <>
struct batch_withdraw<1> final {
  uint16_t version{1};
  std::vector<asset_id_t> asset_ids;
};

using batch_withdraw_t = batch_withdraw<1>;

}  // namespace sharevault::schema
