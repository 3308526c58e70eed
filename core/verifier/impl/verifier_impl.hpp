/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/bls/bls_provider.hpp"
#include "verifier/verifier.hpp"

namespace drand::verifier {
  using crypto::bls::BlsProvider;

  class BeaconVerifierImpl : public BeaconVerifier {
   public:
    /// Uses filcrypto for signatures on G2 and mcl for signatures on G1
    BeaconVerifierImpl();

    /**
     * @param g2_signatures - verifies signatures on G2 with keys on G1
     * @param g1_signatures - verifies signatures on G1 with keys on G2
     */
    BeaconVerifierImpl(std::shared_ptr<BlsProvider> g2_signatures,
                       std::shared_ptr<BlsProvider> g1_signatures);

    outcome::result<bool> verify(const RandomnessBeacon &beacon,
                                 const ChainInfo &info) const override;

   private:
    std::shared_ptr<BlsProvider> g2_signatures_;
    std::shared_ptr<BlsProvider> g1_signatures_;
  };
}  // namespace drand::verifier
