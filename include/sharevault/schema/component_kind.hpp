#pragma once

#include <sharevault/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: component kind.
// Identifies the component deployed on an account. Plain accounts carry
// `none` and can only hold a native balance and sign transactions.
namespace sharevault::schema {

enum class component_kind_t : uint8_t {
  none = 0,
  registry = 1,
  vault = 2,
  nft_registry = 3
};

inline constexpr auto kComponentKindMappings =
    std::array{std::pair<std::string_view, component_kind_t>{
                   "none", component_kind_t::none},
               std::pair<std::string_view, component_kind_t>{
                   "registry", component_kind_t::registry},
               std::pair<std::string_view, component_kind_t>{
                   "vault", component_kind_t::vault},
               std::pair<std::string_view, component_kind_t>{
                   "nft_registry", component_kind_t::nft_registry}};

template <>
inline std::optional<component_kind_t> try_from_string<component_kind_t>(
    const std::string_view value) {
  return from_string(value, kComponentKindMappings);
}

inline constexpr std::string_view to_string(const component_kind_t value) {
  return to_string(value, kComponentKindMappings).value_or("unknown");
}

}  // namespace sharevault::schema
