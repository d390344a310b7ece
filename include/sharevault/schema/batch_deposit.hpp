#pragma once
#include <sharevault/schema/primitives.hpp>
#include <vector>

namespace sharevault::schema {

template <uint16_t Version>
struct batch_deposit;

template <>
struct batch_deposit<1> final {
  uint16_t version{1};
  std::vector<asset_id_t> asset_ids;
};

using batch_deposit_t = batch_deposit<1>;

}  // namespace sharevault::schema
