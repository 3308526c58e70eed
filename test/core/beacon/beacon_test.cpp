/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "beacon/beacon.hpp"

#include <gtest/gtest.h>

#include "testutil/default_print.hpp"
#include "testutil/drand_vectors.hpp"
#include "testutil/outcome.hpp"

namespace drand::beacon {
  using testutil::g1Beacon;
  using testutil::mainnetBeacon;
  using testutil::unchainedBeacon;

  /**
   * @given presence of previous signature and signature lengths
   * @when deriving scheme
   * @then previous signature means chained, 48 bytes mean G1, rest is G2
   */
  TEST(BeaconTest, SchemeIdOf) {
    EXPECT_EQ(schemeIdOf(true, 96), chain::kChainedScheme);
    EXPECT_EQ(schemeIdOf(true, 48), chain::kChainedScheme);
    EXPECT_EQ(schemeIdOf(false, 96), chain::kUnchainedScheme);
    EXPECT_EQ(schemeIdOf(false, 48), chain::kUnchainedOnG1Scheme);
    EXPECT_EQ(schemeIdOf(false, 0), chain::kUnchainedScheme);
  }

  /**
   * @given mainnet beacon of round 1000000
   * @when building its message
   * @then sha256 of previous signature and big endian round is returned
   */
  TEST(BeaconTest, ChainedMessage) {
    EXPECT_OUTCOME_EQ(
        mainnetBeacon().message(),
        "79fcd2842ac7b7b513a492e937f6941d842779bf3a4f7cf55214288aba1259c9"_hash256);
  }

  /**
   * @given mainnet beacon with another round
   * @when building its message
   * @then message changes with the round
   */
  TEST(BeaconTest, ChainedMessageDependsOnRound) {
    auto beacon{mainnetBeacon()};
    beacon.round = 1;
    EXPECT_OUTCOME_EQ(
        beacon.message(),
        "aecdce34e5c524397bc6f4bd4b90444569d42e2cb57591dd5e815189b5d4eecb"_hash256);
  }

  /**
   * @given mainnet beacon with one byte of previous signature flipped
   * @when building its message
   * @then message changes with the previous signature
   */
  TEST(BeaconTest, ChainedMessageDependsOnPreviousSignature) {
    auto beacon{mainnetBeacon()};
    beacon.previous_signature.front() ^= 0x01;
    EXPECT_OUTCOME_EQ(
        beacon.message(),
        "9cb93b773f9e9c78115c3dba82086bbc122ec6749acc39f7025a275b04f6ac12"_hash256);

    beacon = mainnetBeacon();
    beacon.previous_signature.back() ^= 0x80;
    EXPECT_OUTCOME_EQ(
        beacon.message(),
        "64d0d9160debc02c3456e6cec58119bdee11ad91388b7d3fc0b31265cab35e02"_hash256);
  }

  /**
   * @given chained beacons with genesis seed and truncated previous signature
   * @when building their messages
   * @then seed is accepted, other lengths are errors
   */
  TEST(BeaconTest, ChainedMessagePreviousSignatureLength) {
    auto beacon{mainnetBeacon()};
    beacon.round = 1;
    beacon.previous_signature = Bytes(kGenesisSeedSize, 0x11);
    EXPECT_OUTCOME_TRUE_1(beacon.message());

    beacon.previous_signature.resize(kPreviousSignatureSize - 1);
    EXPECT_OUTCOME_ERROR(BeaconError::kInvalidPreviousSignatureLength,
                         beacon.message());
    beacon.previous_signature.clear();
    EXPECT_OUTCOME_ERROR(BeaconError::kInvalidPreviousSignatureLength,
                         RandomnessBeacon{beacon}.message());
  }

  /**
   * @given unchained beacons
   * @when building their messages
   * @then sha256 of big endian round is returned
   */
  TEST(BeaconTest, UnchainedMessage) {
    EXPECT_EQ(
        unchainedBeacon().message(),
        "ce59b701970051bef0d7efdc1a4196c49ce1bbaaf9c5403626ad7adcc41737e7"_hash256);
    EXPECT_OUTCOME_EQ(
        RandomnessBeacon{g1Beacon()}.message(),
        "8b44ff10badf1881f306fd91da65667cc971200af75ac03b04dffcf70dabb5e8"_hash256);
  }

  /**
   * @given beacon of every scheme
   * @when reading it through the variant
   * @then fields and scheme of the stored beacon are returned
   */
  TEST(BeaconTest, Accessors) {
    const RandomnessBeacon chained{mainnetBeacon()};
    EXPECT_TRUE(chained.isChained());
    EXPECT_FALSE(chained.isUnchained());
    EXPECT_FALSE(chained.isSignatureOnG1());
    EXPECT_EQ(chained.schemeId(), chain::kChainedScheme);
    EXPECT_EQ(chained.round(), 1000000);
    EXPECT_EQ(chained.randomness(), mainnetBeacon().randomness);
    EXPECT_EQ(chained.signature(), mainnetBeacon().signature);

    const RandomnessBeacon unchained{unchainedBeacon()};
    EXPECT_FALSE(unchained.isChained());
    EXPECT_TRUE(unchained.isUnchained());
    EXPECT_FALSE(unchained.isSignatureOnG1());
    EXPECT_EQ(unchained.schemeId(), chain::kUnchainedScheme);
    EXPECT_EQ(unchained.signature(), unchainedBeacon().signature);

    const RandomnessBeacon g1{g1Beacon()};
    EXPECT_TRUE(g1.isUnchained());
    EXPECT_TRUE(g1.isSignatureOnG1());
    EXPECT_EQ(g1.schemeId(), chain::kUnchainedOnG1Scheme);
    EXPECT_EQ(g1.round(), 784604);
    EXPECT_EQ(g1.randomness(), g1Beacon().randomness);
  }

  /**
   * @given chained and unchained beacon with same fields
   * @then they are not equal
   */
  TEST(BeaconTest, Equality) {
    const auto chained{mainnetBeacon()};
    const RandomnessBeacon unchained{
        UnchainedBeacon{chained.round, chained.randomness, chained.signature}};
    EXPECT_EQ(RandomnessBeacon{chained}, RandomnessBeacon{mainnetBeacon()});
    EXPECT_NE(RandomnessBeacon{chained}, unchained);
  }
}  // namespace drand::beacon
