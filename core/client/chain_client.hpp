/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "beacon/beacon.hpp"
#include "chain/chain_options.hpp"
#include "common/async.hpp"

namespace drand::client {
  using beacon::TimedBeacon;
  using chain::ChainInfo;
  using chain::ChainOptions;

  enum class ClientError {
    kInvalidChainInfo = 1,
    kInvalidBeacon,
  };

  /**
   * Client of one drand chain. Beacons are returned with the time of their
   * round and, unless disabled by options, only after verification.
   */
  class ChainClient {
   public:
    virtual ~ChainClient() = default;

    /// Chain info matching the chain verification of options
    virtual void chainInfo(CbT<ChainInfo> cb) = 0;

    /// Most recent beacon
    virtual void latest(CbT<TimedBeacon> cb) = 0;

    virtual void get(Round round, CbT<TimedBeacon> cb) = 0;

    /// Beacon of the round emitted at the given unix time
    virtual void getByUnixTime(seconds time, CbT<TimedBeacon> cb) = 0;

    virtual const ChainOptions &options() const = 0;
  };
}  // namespace drand::client

OUTCOME_HPP_DECLARE_ERROR(drand::client, ClientError);
