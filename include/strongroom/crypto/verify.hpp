#pragma once

#include <strongroom/schema/primitives.hpp>

namespace strongroom::crypto {

/// True when the linked OpenSSL provides ed25519.
bool available();

bool verify_signature(const strongroom::schema::bytes_view_t& message,
                      const strongroom::schema::address_t& signer,
                      const strongroom::schema::ed25519_signature_t& signature);

}  // namespace strongroom::crypto
