#pragma once
#include <sharevault/schema/primitives.hpp>

// Registry call: fetch one vault's public info into the cache.
namespace sharevault::schema {

template <uint16_t Version>
struct get_vault_info_by_index;

template <>
struct get_vault_info_by_index<1> final {
  uint16_t version{1};
  uint64_t index{};
};

using get_vault_info_by_index_t = get_vault_info_by_index<1>;

}  // namespace sharevault::schema
