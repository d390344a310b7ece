#pragma once
#include <sharevault/schema/primitives.hpp>

// Asset registry call (owner only): create a unique asset.
namespace sharevault::schema {

template <uint16_t Version>
struct nft_mint;

template <>
struct nft_mint<1> final {
  uint16_t version{1};
  asset_id_t token_id;
  account_id_t owner;
};

using nft_mint_t = nft_mint<1>;

}  // namespace sharevault::schema
