/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "common/blob.hpp"
#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace drand {
  using Round = uint64_t;
  using std::chrono::seconds;
}  // namespace drand

namespace drand::chain {
  using common::Hash256;

  /// Each signature depends on the previous one and on the round
  constexpr std::string_view kChainedScheme{"pedersen-bls-chained"};
  /// Signature on G2 depends on the round only
  constexpr std::string_view kUnchainedScheme{"pedersen-bls-unchained"};
  /// Signature on G1 depends on the round only
  constexpr std::string_view kUnchainedOnG1Scheme{"bls-unchained-on-g1"};

  enum class ChainError {
    kZeroPeriod = 1,
    kBeforeGenesis,
    kRoundOutOfRange,
  };

  /**
   * Cryptographic identity of a drand network. Fixed at genesis, so it is
   * never modified after being fetched.
   */
  struct ChainInfo {
    /** G1 point for signatures on G2, G2 point for signatures on G1 */
    Bytes public_key;
    /** Time between rounds */
    seconds period{};
    /** Unix time of the genesis round */
    seconds genesis_time{};
    /** Chain hash computed by the network over the fields above */
    Hash256 hash;
    /** Hash of the group file of the network */
    Hash256 group_hash;
    std::string scheme_id{kChainedScheme};
    /** Beacon id from chain metadata, empty for single-beacon networks */
    std::string beacon_id;
  };

  inline bool operator==(const ChainInfo &lhs, const ChainInfo &rhs) {
    return lhs.public_key == rhs.public_key && lhs.period == rhs.period
           && lhs.genesis_time == rhs.genesis_time && lhs.hash == rhs.hash
           && lhs.group_hash == rhs.group_hash
           && lhs.scheme_id == rhs.scheme_id
           && lhs.beacon_id == rhs.beacon_id;
  }

  inline bool operator!=(const ChainInfo &lhs, const ChainInfo &rhs) {
    return !(lhs == rhs);
  }

  /**
   * Unix time at which the round is emitted
   * @return genesis time plus round periods, error if it does not fit
   */
  outcome::result<seconds> roundTime(const ChainInfo &info, Round round);

  /// Round emitted at the given unix time
  outcome::result<Round> roundAt(const ChainInfo &info, seconds unix_time);
}  // namespace drand::chain

OUTCOME_HPP_DECLARE_ERROR(drand::chain, ChainError);
