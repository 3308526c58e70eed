/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/chain_info.hpp"

#include <limits>

OUTCOME_CPP_DEFINE_CATEGORY(drand::chain, ChainError, e) {
  using E = drand::chain::ChainError;
  switch (e) {
    case E::kZeroPeriod:
      return "Chain period must be positive";
    case E::kBeforeGenesis:
      return "Requested time is before chain genesis";
    case E::kRoundOutOfRange:
      return "Round is too far from genesis to compute its time";
  }
  return "unknown ChainError error code";
}

namespace drand::chain {
  outcome::result<seconds> roundTime(const ChainInfo &info, Round round) {
    if (info.period.count() <= 0) {
      return ChainError::kZeroPeriod;
    }
    auto limit{std::numeric_limits<seconds::rep>::max()};
    if (info.genesis_time.count() > 0) {
      limit -= info.genesis_time.count();
    }
    if (round > static_cast<Round>(limit / info.period.count())) {
      return ChainError::kRoundOutOfRange;
    }
    return info.genesis_time
           + seconds{static_cast<seconds::rep>(round) * info.period.count()};
  }

  outcome::result<Round> roundAt(const ChainInfo &info, seconds unix_time) {
    if (info.period.count() <= 0) {
      return ChainError::kZeroPeriod;
    }
    if (unix_time < info.genesis_time) {
      return ChainError::kBeforeGenesis;
    }
    return static_cast<Round>((unix_time - info.genesis_time) / info.period);
  }
}  // namespace drand::chain
