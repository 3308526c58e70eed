/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "crypto/bls/bls_types.hpp"

namespace drand::crypto::bls {
  /**
   * @class BLS signature verification on BLS12-381.
   * Each implementation serves one assignment of groups: signature on G2 with
   * key on G1, or signature on G1 with key on G2.
   */
  class BlsProvider {
   public:
    virtual ~BlsProvider() = default;

    /**
     * @brief Verify BLS signature
     * @param message - signed data, hashed to curve by the provider
     * @param signature - compressed signature point
     * @param key - compressed public key point
     * @return false if pairing check fails, error if inputs are malformed
     */
    virtual outcome::result<bool> verifySignature(BytesIn message,
                                                  BytesIn signature,
                                                  BytesIn key) const = 0;
  };
}  // namespace drand::crypto::bls
