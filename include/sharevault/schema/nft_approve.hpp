#pragma once
#include <sharevault/schema/primitives.hpp>

namespace sharevault::schema {

template <uint16_t Version>
struct nft_approve;

template <>
struct nft_approve<1> final {
  uint16_t version{1};
  asset_id_t token_id;
  account_id_t account;
};

using nft_approve_t = nft_approve<1>;

}  // namespace sharevault::schema
