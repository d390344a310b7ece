#pragma once
#include <sharevault/schema/primitives.hpp>
#include <optional>
#include <span>

namespace sharevault::schema::encoding {

// The wire library is a build time choice: callers name a tag type and the
// matching specialization does the work. Hot swapping is not supported.
template <typename Library>
struct encoder {
  template <typename T>
  sharevault::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, sharevault::schema::bytes_t& out);

  template <typename T>
  T decode(const sharevault::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const sharevault::schema::bytes_view_t& bytes);
};

}  // namespace sharevault::schema::encoding
