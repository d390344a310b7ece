#pragma once
#include <sharevault/schema/nft_token.hpp>
#include <sharevault/schema/primitives.hpp>
#include <cstdint>
#include <map>

// Schema type: nft registry state.
namespace sharevault::schema {

template <uint16_t Version>
struct nft_registry_state;

template <>
struct nft_registry_state<1> final {
  uint16_t version{1};
  account_id_t owner;
  std::map<asset_id_t, nft_token_t> tokens;
};

using nft_registry_state_t = nft_registry_state<1>;

}  // namespace sharevault::schema
