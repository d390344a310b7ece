#pragma once
#include <sharevault/schema/primitives.hpp>

namespace sharevault::schema {

template <uint16_t Version>
struct get_info;

template <>
struct get_info<1> final {
  uint16_t version{1};
};

using get_info_t = get_info<1>;

}  // namespace sharevault::schema
