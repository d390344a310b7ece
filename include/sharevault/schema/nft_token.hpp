#pragma once
#include <sharevault/schema/primitives.hpp>
#include <cstdint>
#include <map>

// Schema type: nft token.
// One unique asset held by the asset registry, with its approved accounts.
namespace sharevault::schema {

template <uint16_t Version>
struct nft_token;

template <>
struct nft_token<1> final {
  uint16_t version{1};
  asset_id_t token_id;
  account_id_t owner;
  std::map<account_id_t, uint64_t> approvals;
  uint64_t next_approval_id{};
};

using nft_token_t = nft_token<1>;

}  // namespace sharevault::schema
