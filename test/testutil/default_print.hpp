/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest-printers.h>
#include <boost/optional.hpp>

#include "beacon/beacon.hpp"
#include "common/hexutil.hpp"

namespace drand::chain {
  inline void PrintTo(const ChainInfo &v, ::std::ostream *os) {
    *os << "ChainInfo{" << v.hash.toHex() << ", " << v.scheme_id << "}";
  }
}  // namespace drand::chain

namespace drand::beacon {
  inline void PrintTo(const ChainedBeacon &v, ::std::ostream *os) {
    *os << "ChainedBeacon{" << v.round << ", "
        << common::hex_lower(v.signature) << "}";
  }

  inline void PrintTo(const UnchainedBeacon &v, ::std::ostream *os) {
    *os << "UnchainedBeacon{" << v.round << ", "
        << common::hex_lower(v.signature) << "}";
  }

  inline void PrintTo(const RandomnessBeacon &v, ::std::ostream *os) {
    if (const auto *chained{boost::get<ChainedBeacon>(&v)}) {
      PrintTo(*chained, os);
    } else {
      PrintTo(boost::get<UnchainedBeacon>(v), os);
    }
  }

  inline void PrintTo(const TimedBeacon &v, ::std::ostream *os) {
    PrintTo(v.beacon, os);
    *os << " at " << v.time.count();
  }
}  // namespace drand::beacon

namespace boost {
  template <typename T>
  void PrintTo(const optional<T> &v, ::std::ostream *os) {
    if (v) {
      *os << ::testing::PrintToString(*v);
    } else {
      *os << "none";
    }
  }
}  // namespace boost
