#pragma once

#include <cstdint>

// Schema type: query error code.
namespace sharevault::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
  rejected = 4,
};

}  // namespace sharevault::schema
