/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/impl/verifier_impl.hpp"

#include <algorithm>

#include "crypto/bls/impl/bls_g1_provider_impl.hpp"
#include "crypto/bls/impl/bls_provider_impl.hpp"
#include "crypto/sha/sha256.hpp"

namespace drand::verifier {
  BeaconVerifierImpl::BeaconVerifierImpl()
      : BeaconVerifierImpl{
          std::make_shared<crypto::bls::BlsProviderImpl>(),
          std::make_shared<crypto::bls::BlsG1ProviderImpl>()} {}

  BeaconVerifierImpl::BeaconVerifierImpl(
      std::shared_ptr<BlsProvider> g2_signatures,
      std::shared_ptr<BlsProvider> g1_signatures)
      : g2_signatures_{std::move(g2_signatures)},
        g1_signatures_{std::move(g1_signatures)} {}

  outcome::result<bool> BeaconVerifierImpl::verify(
      const RandomnessBeacon &beacon, const ChainInfo &info) const {
    // beacon of another scheme cannot belong to this chain
    if (beacon.schemeId() != info.scheme_id) {
      return false;
    }

    OUTCOME_TRY(message, beacon.message());
    const auto &bls{beacon.isSignatureOnG1() ? g1_signatures_
                                             : g2_signatures_};
    OUTCOME_TRY(signature_valid,
                bls->verifySignature(
                    message, beacon.signature(), info.public_key));

    const auto randomness{crypto::sha::sha256(beacon.signature())};
    const auto randomness_valid{std::equal(randomness.begin(),
                                           randomness.end(),
                                           beacon.randomness().begin(),
                                           beacon.randomness().end())};

    return signature_valid && randomness_valid;
  }
}  // namespace drand::verifier
