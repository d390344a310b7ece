#pragma once
#include <sharevault/schema/primitives.hpp>

// Vault resumption for one asset transfer leg of a settlement intent.
namespace sharevault::schema {

template <uint16_t Version>
struct on_transfer_settled;

template <>
struct on_transfer_settled<1> final {
  uint16_t version{1};
  uint64_t intent_id{};
  asset_id_t asset_id;
};

using on_transfer_settled_t = on_transfer_settled<1>;

}  // namespace sharevault::schema
