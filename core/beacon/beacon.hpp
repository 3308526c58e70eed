/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/variant.hpp>

#include "chain/chain_info.hpp"
#include "crypto/bls/bls_types.hpp"

namespace drand::beacon {
  using common::Hash256;

  enum class BeaconError {
    kInvalidPreviousSignatureLength = 1,
  };

  /// Previous signature of a chained beacon, BLS signature on G2
  constexpr size_t kPreviousSignatureSize = crypto::bls::kG2Size;
  /// Previous signature of the first round is the genesis seed
  constexpr size_t kGenesisSeedSize = Hash256::size();

  /**
   * Scheme of a beacon, derived from its wire shape only. Beacons with a
   * previous signature are chained. Unchained beacons with a 48 byte
   * signature are signed on G1, any other length means signature on G2.
   * @param has_previous_signature - previous signature present on the wire
   * @param signature_size - signature length in bytes
   * @return scheme id, one of the constants from chain_info.hpp
   */
  std::string_view schemeIdOf(bool has_previous_signature,
                              size_t signature_size);

  /**
   * Beacon whose signature covers the previous round signature
   */
  struct ChainedBeacon {
    Round round{};
    Bytes randomness;
    Bytes signature;
    Bytes previous_signature;

    /// sha256(previous_signature || uint64be(round))
    outcome::result<Hash256> message() const;
  };

  inline bool operator==(const ChainedBeacon &lhs, const ChainedBeacon &rhs) {
    return lhs.round == rhs.round && lhs.randomness == rhs.randomness
           && lhs.signature == rhs.signature
           && lhs.previous_signature == rhs.previous_signature;
  }

  /**
   * Beacon whose signature covers only the round number
   */
  struct UnchainedBeacon {
    Round round{};
    Bytes randomness;
    Bytes signature;

    /// sha256(uint64be(round))
    Hash256 message() const;
  };

  inline bool operator==(const UnchainedBeacon &lhs,
                         const UnchainedBeacon &rhs) {
    return lhs.round == rhs.round && lhs.randomness == rhs.randomness
           && lhs.signature == rhs.signature;
  }

  /**
   * Randomness published for one round
   */
  struct RandomnessBeacon
      : public boost::variant<ChainedBeacon, UnchainedBeacon> {
    using variant::variant;
    using base_type = boost::variant<ChainedBeacon, UnchainedBeacon>;

    inline bool operator==(const RandomnessBeacon &other) const {
      return base_type::operator==(static_cast<const base_type &>(other));
    }

    Round round() const;

    const Bytes &randomness() const;

    const Bytes &signature() const;

    std::string_view schemeId() const;

    bool isChained() const;

    bool isUnchained() const;

    bool isSignatureOnG1() const;

    /// Digest the network signed for this beacon
    outcome::result<Hash256> message() const;
  };

  inline bool operator!=(const RandomnessBeacon &lhs,
                         const RandomnessBeacon &rhs) {
    return !(lhs == rhs);
  }

  /// Beacon with unix time of its round
  struct TimedBeacon {
    RandomnessBeacon beacon;
    seconds time{};
  };

  inline bool operator==(const TimedBeacon &lhs, const TimedBeacon &rhs) {
    return lhs.beacon == rhs.beacon && lhs.time == rhs.time;
  }
}  // namespace drand::beacon

OUTCOME_HPP_DECLARE_ERROR(drand::beacon, BeaconError);
