#pragma once

#include <sharevault/schema/primitives.hpp>
#include <functional>

namespace sharevault::execution {

using signature_verifier_t = std::function<bool(
    const sharevault::schema::bytes_view_t& message,
    const sharevault::schema::ed25519_public_key_t& public_key,
    const sharevault::schema::ed25519_signature_t& signature)>;

}  // namespace sharevault::execution
