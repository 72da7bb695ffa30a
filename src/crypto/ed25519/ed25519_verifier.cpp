/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/ed25519/ed25519_verifier.hpp"

#include <algorithm>

#include "crypto/ed25519.hpp"

namespace light::crypto {

  static_assert(PUBLIC_KEY_SIZE == ED25519_PUBLIC_KEY_LENGTH);
  static_assert(SIGNATURE_SIZE == ED25519_SIGNATURE_LENGTH);

  bool Ed25519Verifier::verify(const PublicKey &public_key,
                               qtils::BytesIn message,
                               qtils::BytesIn signature) const {
    if (signature.size() != ED25519_SIGNATURE_LENGTH) {
      return false;
    }
    ed25519::Signature sig;
    std::ranges::copy(signature, sig.begin());
    return ed25519::verify(sig, message, public_key);
  }

}  // namespace light::crypto
