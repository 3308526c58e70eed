/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/bls/bls_provider.hpp"

namespace drand::crypto::bls {
  /**
   * Signatures on G2 (96 bytes) verified against public keys on G1 (48
   * bytes), message hashed with BLS_SIG_BLS12381G2_XMD:SHA-256_SSWU_RO_NUL_
   */
  class BlsProviderImpl : public BlsProvider {
   public:
    outcome::result<bool> verifySignature(BytesIn message,
                                          BytesIn signature,
                                          BytesIn key) const override;

   private:
    /**
     * @brief Generate BLS message digest
     * @param message - data for hashing
     * @return BLS digest or error code
     */
    static outcome::result<Digest> generateHash(BytesIn message);
  };
}  // namespace drand::crypto::bls
