#pragma once
#include <sharevault/schema/primitives.hpp>

// Vault call: close the caller's ledger account. With force, a remaining
// balance is burned.
namespace sharevault::schema {

template <uint16_t Version>
struct storage_unregister;

template <>
struct storage_unregister<1> final {
  uint16_t version{1};
  bool force{};
};

using storage_unregister_t = storage_unregister<1>;

}  // namespace sharevault::schema
