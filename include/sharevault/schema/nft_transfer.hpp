#pragma once
#include <sharevault/schema/primitives.hpp>
#include <optional>

// Schema type: nft transfer.
// Asset registry call: move a unique asset to a new owner. The predecessor
// must own the asset or hold an approval for it.
namespace sharevault::schema {

template <uint16_t Version>
struct nft_transfer;

template <>
struct nft_transfer<1> final {
  uint16_t version{1};
  account_id_t receiver;
  asset_id_t token_id;
  std::optional<uint64_t> approval_id;
  std::optional<std::string> memo;
};

using nft_transfer_t = nft_transfer<1>;

}  // namespace sharevault::schema
