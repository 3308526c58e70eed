/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/bls/bls_provider.hpp"

namespace drand::crypto::bls {
  /**
   * Signatures on G1 (48 bytes) verified against public keys on G2 (96
   * bytes). Messages are hashed to G1 with the G2 domain separation tag, the
   * way drand "bls-unchained-on-g1" networks sign.
   */
  class BlsG1ProviderImpl : public BlsProvider {
   public:
    BlsG1ProviderImpl();

    outcome::result<bool> verifySignature(BytesIn message,
                                          BytesIn signature,
                                          BytesIn key) const override;
  };
}  // namespace drand::crypto::bls
