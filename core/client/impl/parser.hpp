/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "beacon/beacon.hpp"
#include "chain/chain_info.hpp"

namespace drand::client {
  using beacon::RandomnessBeacon;
  using beacon::TimedBeacon;
  using chain::ChainInfo;

  /**
   * Conversion between drand HTTP API json documents and chain types
   */
  class JsonParser {
   public:
    /// Parses body of `GET /info`
    static outcome::result<ChainInfo> parseChainInfo(std::string_view input);

    /**
     * Parses body of `GET /public/{round}`. Presence of previous_signature
     * makes a chained beacon.
     */
    static outcome::result<RandomnessBeacon> parseBeacon(
        std::string_view input);

    static outcome::result<std::string> encodeChainInfo(const ChainInfo &info);

    static outcome::result<std::string> encodeBeacon(
        const RandomnessBeacon &beacon);

    /// Beacon fields plus "time" of the round
    static outcome::result<std::string> encodeTimedBeacon(
        const TimedBeacon &timed);
  };
}  // namespace drand::client
