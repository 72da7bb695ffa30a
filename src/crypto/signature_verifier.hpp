/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/bytes.hpp>

#include "types/types.hpp"

namespace light::crypto {

  /**
   * Signature scheme of the counterparty chain validators.
   */
  class SignatureVerifier {
   public:
    virtual ~SignatureVerifier() = default;

    /**
     * @return true iff `signature` is a valid signature of `message` under
     * `public_key`
     */
    virtual bool verify(const PublicKey &public_key,
                        qtils::BytesIn message,
                        qtils::BytesIn signature) const = 0;
  };

}  // namespace light::crypto
