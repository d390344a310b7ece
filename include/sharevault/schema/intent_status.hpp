#pragma once

#include <sharevault/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: intent status.
// Settlement lifecycle shared by intents and their individual transfer legs.
// Legs only ever take pending, settled or failed.
namespace sharevault::schema {

enum class intent_status_t : uint8_t {
  pending = 0,
  settled = 1,
  partially_failed = 2,
  failed = 3
};

inline constexpr auto kIntentStatusMappings =
    std::array{std::pair<std::string_view, intent_status_t>{
                   "pending", intent_status_t::pending},
               std::pair<std::string_view, intent_status_t>{
                   "settled", intent_status_t::settled},
               std::pair<std::string_view, intent_status_t>{
                   "partially_failed", intent_status_t::partially_failed},
               std::pair<std::string_view, intent_status_t>{
                   "failed", intent_status_t::failed}};

template <>
inline std::optional<intent_status_t> try_from_string<intent_status_t>(
    const std::string_view value) {
  return from_string(value, kIntentStatusMappings);
}

inline constexpr std::string_view to_string(const intent_status_t value) {
  return to_string(value, kIntentStatusMappings).value_or("unknown");
}

}  // namespace sharevault::schema
