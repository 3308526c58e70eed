/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "beacon/beacon.hpp"
#include "chain/chain_info.hpp"
#include "common/async.hpp"

namespace drand::client {
  using beacon::RandomnessBeacon;
  using chain::ChainInfo;

  /**
   * Retrieval of chain data from a drand endpoint
   */
  class Transport {
   public:
    virtual ~Transport() = default;

    /// Requests chain info of the endpoint
    virtual void fetchInfo(CbT<ChainInfo> cb) = 0;

    /**
     * Requests a beacon
     * @param round - round to request, none for the latest round
     * @param bust_cache - make request unique so intermediate caches do not
     * answer it
     * @param cb - receives the beacon as published, not verified
     */
    virtual void fetchBeacon(boost::optional<Round> round,
                             bool bust_cache,
                             CbT<RandomnessBeacon> cb) = 0;
  };
}  // namespace drand::client
