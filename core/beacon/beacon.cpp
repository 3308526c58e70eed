/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "beacon/beacon.hpp"

#include "common/endian.hpp"
#include "common/visitor.hpp"
#include "crypto/sha/sha256.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(drand::beacon, BeaconError, e) {
  using E = drand::beacon::BeaconError;
  switch (e) {
    case E::kInvalidPreviousSignatureLength:
      return "Previous signature is neither a signature nor a genesis seed";
  }
  return "unknown BeaconError error code";
}

namespace drand::beacon {
  std::string_view schemeIdOf(bool has_previous_signature,
                              size_t signature_size) {
    if (has_previous_signature) {
      return chain::kChainedScheme;
    }
    if (signature_size == crypto::bls::kG1Size) {
      return chain::kUnchainedOnG1Scheme;
    }
    return chain::kUnchainedScheme;
  }

  outcome::result<Hash256> ChainedBeacon::message() const {
    if (previous_signature.size() != kPreviousSignatureSize
        && previous_signature.size() != kGenesisSeedSize) {
      return BeaconError::kInvalidPreviousSignatureLength;
    }
    Bytes buffer;
    buffer.reserve(previous_signature.size() + sizeof(Round));
    append(buffer, previous_signature);
    common::putUint64BigEndian(buffer, round);
    return crypto::sha::sha256(buffer);
  }

  Hash256 UnchainedBeacon::message() const {
    return crypto::sha::sha256(common::uint64BigEndian(round));
  }

  Round RandomnessBeacon::round() const {
    return visit_in_place(*this, [](const auto &beacon) {
      return beacon.round;
    });
  }

  const Bytes &RandomnessBeacon::randomness() const {
    if (const auto *chained{boost::get<ChainedBeacon>(this)}) {
      return chained->randomness;
    }
    return boost::get<UnchainedBeacon>(*this).randomness;
  }

  const Bytes &RandomnessBeacon::signature() const {
    if (const auto *chained{boost::get<ChainedBeacon>(this)}) {
      return chained->signature;
    }
    return boost::get<UnchainedBeacon>(*this).signature;
  }

  std::string_view RandomnessBeacon::schemeId() const {
    return schemeIdOf(isChained(), signature().size());
  }

  bool RandomnessBeacon::isChained() const {
    return visit_in_place(
        *this,
        [](const ChainedBeacon &) { return true; },
        [](const UnchainedBeacon &) { return false; });
  }

  bool RandomnessBeacon::isUnchained() const {
    return !isChained();
  }

  bool RandomnessBeacon::isSignatureOnG1() const {
    return schemeId() == chain::kUnchainedOnG1Scheme;
  }

  outcome::result<Hash256> RandomnessBeacon::message() const {
    return visit_in_place(
        *this,
        [](const ChainedBeacon &beacon) { return beacon.message(); },
        [](const UnchainedBeacon &beacon) -> outcome::result<Hash256> {
          return beacon.message();
        });
  }
}  // namespace drand::beacon
