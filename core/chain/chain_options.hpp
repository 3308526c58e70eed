/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "chain/chain_info.hpp"

namespace drand::chain {
  /**
   * Expectations a fetched chain info must satisfy. Absent expectations are
   * not checked.
   */
  struct ChainVerification {
    boost::optional<Hash256> hash;
    boost::optional<Bytes> public_key;

    bool verify(const ChainInfo &info) const;
  };

  /// Policy of a chain client
  struct ChainOptions {
    /** Verify every fetched beacon against chain info */
    bool is_beacon_verification{true};
    /** Keep chain info after the first fetch, and let beacons be cached */
    bool is_cache{true};
    ChainVerification chain_verification;

    bool verify(const ChainInfo &info) const {
      return chain_verification.verify(info);
    }
  };
}  // namespace drand::chain
