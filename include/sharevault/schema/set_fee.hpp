#pragma once
#include <sharevault/schema/primitives.hpp>

namespace sharevault::schema {

template <uint16_t Version>
struct set_fee;

template <>
struct set_fee<1> final {
  uint16_t version{1};
  amount_t fee{};
};

using set_fee_t = set_fee<1>;

}  // namespace sharevault::schema
