#pragma once
#include <sharevault/schema/primitives.hpp>

// Registry resumption for a get_info request.
namespace sharevault::schema {

template <uint16_t Version>
struct on_vault_info;

template <>
struct on_vault_info<1> final {
  uint16_t version{1};
  uint64_t index{};
};

using on_vault_info_t = on_vault_info<1>;

}  // namespace sharevault::schema
