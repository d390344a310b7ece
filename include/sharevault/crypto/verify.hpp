#pragma once

#include <sharevault/schema/primitives.hpp>

namespace sharevault::crypto {

bool available();

bool verify_signature(const sharevault::schema::bytes_view_t& message,
                      const sharevault::schema::ed25519_public_key_t& public_key,
                      const sharevault::schema::ed25519_signature_t& signature);

}  // namespace sharevault::crypto
