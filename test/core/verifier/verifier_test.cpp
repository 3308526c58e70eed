/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/impl/verifier_impl.hpp"

#include <gmock/gmock.h>

#include "testutil/default_print.hpp"
#include "testutil/drand_vectors.hpp"
#include "testutil/g1_signer.hpp"
#include "testutil/mocks/crypto/bls/bls_provider_mock.hpp"
#include "testutil/outcome.hpp"

namespace drand::verifier {
  using beacon::ChainedBeacon;
  using beacon::UnchainedBeacon;
  using crypto::bls::BlsProviderMock;
  using testing::_;
  using testing::Return;
  using testutil::G1Signer;
  using testutil::g1Beacon;
  using testutil::mainnetBeacon;
  using testutil::mainnetInfo;
  using testutil::unchainedBeacon;
  using testutil::unchainedInfo;

  MATCHER_P(BytesEq, expected, "") {
    return std::equal(
        arg.begin(), arg.end(), std::begin(expected), std::end(expected));
  }

  class BeaconVerifierTest : public ::testing::Test {
   public:
    /// Chain of the G1 beacon, key is not checked by mocks
    static ChainInfo g1Info() {
      auto info{unchainedInfo()};
      info.scheme_id = chain::kUnchainedOnG1Scheme;
      info.public_key = Bytes(crypto::bls::kG2Size, 0x01);
      return info;
    }

    std::shared_ptr<BlsProviderMock> g2_signatures_{
        std::make_shared<BlsProviderMock>()};
    std::shared_ptr<BlsProviderMock> g1_signatures_{
        std::make_shared<BlsProviderMock>()};
    BeaconVerifierImpl verifier_{g2_signatures_, g1_signatures_};
  };

  /**
   * @given chained beacon and unchained chain
   * @when verifying
   * @then beacon is invalid without checking signature
   */
  TEST_F(BeaconVerifierTest, SchemeMismatch) {
    EXPECT_CALL(*g2_signatures_, verifySignature(_, _, _)).Times(0);
    EXPECT_CALL(*g1_signatures_, verifySignature(_, _, _)).Times(0);
    EXPECT_OUTCOME_EQ(verifier_.verify(mainnetBeacon(), unchainedInfo()),
                      false);
    EXPECT_OUTCOME_EQ(verifier_.verify(unchainedBeacon(), mainnetInfo()),
                      false);
    EXPECT_OUTCOME_EQ(verifier_.verify(g1Beacon(), unchainedInfo()), false);
  }

  /**
   * @given chained beacon with valid signature
   * @when verifying
   * @then G2 signature of chained message is checked with chain key
   */
  TEST_F(BeaconVerifierTest, ChainedUsesG2) {
    const auto beacon{mainnetBeacon()};
    const auto info{mainnetInfo()};
    EXPECT_CALL(*g2_signatures_,
                verifySignature(BytesEq(beacon.message().value()),
                                BytesEq(beacon.signature),
                                BytesEq(info.public_key)))
        .WillOnce(Return(outcome::result<bool>{true}));
    EXPECT_CALL(*g1_signatures_, verifySignature(_, _, _)).Times(0);
    EXPECT_OUTCOME_EQ(verifier_.verify(beacon, info), true);
  }

  /**
   * @given unchained beacon signed on G1
   * @when verifying
   * @then G1 signature of round message is checked
   */
  TEST_F(BeaconVerifierTest, G1SignatureUsesG1) {
    const auto beacon{g1Beacon()};
    EXPECT_CALL(*g2_signatures_, verifySignature(_, _, _)).Times(0);
    EXPECT_CALL(*g1_signatures_,
                verifySignature(BytesEq(beacon.message()),
                                BytesEq(beacon.signature),
                                BytesEq(g1Info().public_key)))
        .WillOnce(Return(outcome::result<bool>{true}));
    EXPECT_OUTCOME_EQ(verifier_.verify(beacon, g1Info()), true);
  }

  /**
   * @given beacon whose signature does not verify
   * @when verifying
   * @then beacon is invalid
   */
  TEST_F(BeaconVerifierTest, InvalidSignature) {
    EXPECT_CALL(*g2_signatures_, verifySignature(_, _, _))
        .WillOnce(Return(outcome::result<bool>{false}));
    EXPECT_OUTCOME_EQ(verifier_.verify(unchainedBeacon(), unchainedInfo()),
                      false);
  }

  /**
   * @given beacon with valid signature and tampered randomness
   * @when verifying
   * @then beacon is invalid
   */
  TEST_F(BeaconVerifierTest, RandomnessMismatch) {
    auto beacon{unchainedBeacon()};
    beacon.randomness[0] ^= 1;
    EXPECT_CALL(*g2_signatures_, verifySignature(_, _, _))
        .WillOnce(Return(outcome::result<bool>{true}));
    EXPECT_OUTCOME_EQ(verifier_.verify(beacon, unchainedInfo()), false);
  }

  /**
   * @given provider failing on malformed key
   * @when verifying
   * @then provider error is returned
   */
  TEST_F(BeaconVerifierTest, ProviderError) {
    EXPECT_CALL(*g2_signatures_, verifySignature(_, _, _))
        .WillOnce(Return(outcome::result<bool>{
            crypto::bls::Errors::kInvalidPublicKeyLength}));
    EXPECT_OUTCOME_ERROR(crypto::bls::Errors::kInvalidPublicKeyLength,
                         verifier_.verify(unchainedBeacon(), unchainedInfo()));
  }

  /**
   * @given chained beacon with malformed previous signature
   * @when verifying
   * @then message error is returned before checking signature
   */
  TEST_F(BeaconVerifierTest, MalformedPreviousSignature) {
    auto beacon{mainnetBeacon()};
    beacon.previous_signature.resize(10);
    EXPECT_CALL(*g2_signatures_, verifySignature(_, _, _)).Times(0);
    EXPECT_OUTCOME_ERROR(beacon::BeaconError::kInvalidPreviousSignatureLength,
                         verifier_.verify(beacon, mainnetInfo()));
  }

  /**
   * @given published beacons and chain infos of public networks
   * @when verifying with pairing libraries
   * @then beacons verify against their own chain only
   */
  TEST(BeaconVerifierImplTest, PublicNetworks) {
    BeaconVerifierImpl verifier;
    EXPECT_OUTCOME_EQ(verifier.verify(mainnetBeacon(), mainnetInfo()), true);
    EXPECT_OUTCOME_EQ(verifier.verify(unchainedBeacon(), unchainedInfo()),
                      true);

    // same inputs, same result
    EXPECT_OUTCOME_EQ(verifier.verify(mainnetBeacon(), mainnetInfo()), true);
    EXPECT_OUTCOME_EQ(verifier.verify(unchainedBeacon(), unchainedInfo()),
                      true);

    auto other_round{mainnetBeacon()};
    other_round.round = 1;
    EXPECT_OUTCOME_EQ(verifier.verify(other_round, mainnetInfo()), false);

    // same scheme, key of another network
    auto other_key{unchainedInfo()};
    other_key.public_key = mainnetInfo().public_key;
    EXPECT_OUTCOME_EQ(verifier.verify(unchainedBeacon(), other_key), false);
    EXPECT_OUTCOME_EQ(verifier.verify(unchainedBeacon(), other_key), false);
  }

  /**
   * @given beacon signed on G1 and chain of its signer
   * @when verifying with pairing libraries
   * @then beacon verifies on its chain only and forged randomness fails
   */
  TEST(BeaconVerifierImplTest, SignatureOnG1) {
    BeaconVerifierImpl verifier;
    const G1Signer signer;
    const auto beacon{signer.signedBeacon(784604)};
    const auto info{signer.chainInfo()};
    EXPECT_OUTCOME_EQ(verifier.verify(beacon, info), true);
    EXPECT_OUTCOME_EQ(verifier.verify(beacon, info), true);

    EXPECT_OUTCOME_EQ(verifier.verify(beacon, unchainedInfo()), false);
    EXPECT_OUTCOME_EQ(verifier.verify(g1Beacon(), unchainedInfo()), false);
    EXPECT_OUTCOME_EQ(verifier.verify(g1Beacon(), info), false);

    auto forged{beacon};
    forged.randomness = g1Beacon().randomness;
    EXPECT_OUTCOME_EQ(verifier.verify(forged, info), false);
  }
}  // namespace drand::verifier
