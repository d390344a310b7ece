#pragma once

#include <sharevault/schema/primitives.hpp>
#include <cstdint>

// Schema type: commit result.
// Records the finalized height and state root persisted by commit.
namespace sharevault::schema {

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t retain_height{};
  int64_t committed_height{};
  hash32_t state_root{};
};

using commit_result_t = commit_result<1>;

}  // namespace sharevault::schema
