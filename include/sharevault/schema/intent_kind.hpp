#pragma once

#include <sharevault/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: intent kind.
namespace sharevault::schema {

enum class intent_kind_t : uint8_t { deposit = 0, withdraw = 1, swap = 2 };

inline constexpr auto kIntentKindMappings = std::array{
    std::pair<std::string_view, intent_kind_t>{"deposit",
                                               intent_kind_t::deposit},
    std::pair<std::string_view, intent_kind_t>{"withdraw",
                                               intent_kind_t::withdraw},
    std::pair<std::string_view, intent_kind_t>{"swap", intent_kind_t::swap}};

template <>
inline std::optional<intent_kind_t> try_from_string<intent_kind_t>(
    const std::string_view value) {
  return from_string(value, kIntentKindMappings);
}

inline constexpr std::string_view to_string(const intent_kind_t value) {
  return to_string(value, kIntentKindMappings).value_or("unknown");
}

}  // namespace sharevault::schema
