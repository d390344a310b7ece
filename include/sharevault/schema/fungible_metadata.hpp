#pragma once
#include <sharevault/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: fungible metadata.
// Descriptive metadata of a vault's share token.
namespace sharevault::schema {

inline constexpr std::string_view kFungibleMetadataSpec{"sharevault-ft-1.0.0"};
inline constexpr uint8_t kShareDecimals{24};

template <uint16_t Version>
struct fungible_metadata;

template <>
struct fungible_metadata<1> final {
  uint16_t version{1};
  std::string spec{kFungibleMetadataSpec};
  std::string name;
  std::string symbol;
  std::optional<std::string> icon;
  std::optional<std::string> reference;
  std::optional<bytes_t> reference_hash;
  uint8_t decimals{kShareDecimals};
};

using fungible_metadata_t = fungible_metadata<1>;

/// The spec string must match, `reference` and `reference_hash` must be
/// present together, and a present `reference_hash` must be 32 bytes.
bool is_valid(const fungible_metadata_t& metadata);

}  // namespace sharevault::schema
