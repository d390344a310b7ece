#pragma once
#include <sharevault/schema/primitives.hpp>

// Registry call: clear the info cache and re-request every vault.
namespace sharevault::schema {

template <uint16_t Version>
struct refresh_all;

template <>
struct refresh_all<1> final {
  uint16_t version{1};
};

using refresh_all_t = refresh_all<1>;

}  // namespace sharevault::schema
