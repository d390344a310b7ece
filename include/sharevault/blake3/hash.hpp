#pragma once
#include <blake3.h>
#include <sharevault/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace sharevault::blake3 {

sharevault::schema::hash32_t hash(const std::string_view& str);
sharevault::schema::hash32_t hash(const sharevault::schema::bytes_view_t& bytes);

/// Incremental hasher for material that is produced piecewise, such as the
/// per-block state root.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const sharevault::schema::bytes_view_t& bytes);

  sharevault::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

}  // namespace sharevault::blake3
