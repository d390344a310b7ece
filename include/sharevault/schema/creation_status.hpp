#pragma once

#include <sharevault/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: creation status.
// Vault provisioning saga: pending until the batch outcome resumes the
// registry, failed when the batch was rejected. Confirmed creations are
// removed and replaced by a vault record.
namespace sharevault::schema {

enum class creation_status_t : uint8_t { pending = 0, failed = 1 };

inline constexpr auto kCreationStatusMappings =
    std::array{std::pair<std::string_view, creation_status_t>{
                   "pending", creation_status_t::pending},
               std::pair<std::string_view, creation_status_t>{
                   "failed", creation_status_t::failed}};

inline constexpr std::string_view to_string(const creation_status_t value) {
  return to_string(value, kCreationStatusMappings).value_or("unknown");
}

}  // namespace sharevault::schema
