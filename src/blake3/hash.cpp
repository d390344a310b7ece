#include <sharevault/blake3/hash.hpp>

namespace sharevault::blake3 {

sharevault::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

sharevault::schema::hash32_t hash(
    const sharevault::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const sharevault::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

sharevault::schema::hash32_t hasher::finalize() const {
  auto output = sharevault::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

}  // namespace sharevault::blake3
