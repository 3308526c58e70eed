/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "beacon/beacon.hpp"
#include "chain/chain_info.hpp"

namespace drand::verifier {
  using beacon::RandomnessBeacon;
  using chain::ChainInfo;

  /**
   * Checks beacons against the identity of a chain
   */
  class BeaconVerifier {
   public:
    virtual ~BeaconVerifier() = default;

    /**
     * Verifies that the beacon belongs to the chain, that its signature is
     * valid under the chain key and that its randomness is the sha256 of the
     * signature
     * @param beacon - beacon to verify
     * @param info - chain the beacon is expected to come from
     * @return false for an invalid beacon, error only for malformed input
     */
    virtual outcome::result<bool> verify(const RandomnessBeacon &beacon,
                                         const ChainInfo &info) const = 0;
  };
}  // namespace drand::verifier
