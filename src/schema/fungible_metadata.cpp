#include <sharevault/schema/fungible_metadata.hpp>

namespace sharevault::schema {

bool is_valid(const fungible_metadata_t& metadata) {
  if (metadata.spec != kFungibleMetadataSpec) {
    return false;
  }
  if (metadata.reference.has_value() != metadata.reference_hash.has_value()) {
    return false;
  }
  if (metadata.reference_hash && metadata.reference_hash->size() != 32) {
    return false;
  }
  return true;
}

}  // namespace sharevault::schema
