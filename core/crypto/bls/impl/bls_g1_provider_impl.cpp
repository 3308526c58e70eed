/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bls/impl/bls_g1_provider_impl.hpp"

#include <mutex>
#include <string_view>

#include <mcl/bls12_381.hpp>

#include "common/hexutil.hpp"

namespace drand::crypto::bls {
  namespace bn = mcl::bn;

  namespace {
    constexpr std::string_view kDst{
        "BLS_SIG_BLS12381G2_XMD:SHA-256_SSWU_RO_NUL_"};

    /// Compressed G2 generator
    constexpr std::string_view kG2Generator{
        "93e02b6052719f607dacd3a088274f65596bd0d09920b61ab5da61bbdc7f5049"
        "334cf11213945d57e5ac7d055d042b7e024aa2b2f08f0a91260805272dc51051"
        "c6e47ad4fa403b02b4510b647ae3d1770bac0326a805bbefd48056c8c121bdb8"};

    struct Curve {
      bool initialised{false};
      bn::G2 generator;
    };

    std::once_flag curve_once;
    Curve curve;

    // mcl keeps curve parameters in globals, set up once per process
    void initCurve() {
      bool ok{true};
      bn::initPairing(&ok, mcl::BLS12_381);
      if (!ok) {
        return;
      }
      // deserialize rejects points outside the prime order subgroup
      bn::verifyOrderG1(true);
      bn::verifyOrderG2(true);
      bn::setETHserialization(true);
      if (!bn::setMapToMode(MCL_MAP_TO_MODE_HASH_TO_CURVE)) {
        return;
      }
      if (!bn::setDstG1(kDst.data(), kDst.size())) {
        return;
      }
      auto generator{common::unhex(kG2Generator)};
      if (!generator
          || curve.generator.deserialize(generator.value().data(),
                                         generator.value().size())
                 == 0) {
        return;
      }
      curve.initialised = true;
    }
  }  // namespace

  BlsG1ProviderImpl::BlsG1ProviderImpl() {
    std::call_once(curve_once, initCurve);
  }

  outcome::result<bool> BlsG1ProviderImpl::verifySignature(
      BytesIn message, BytesIn signature, BytesIn key) const {
    if (!curve.initialised) {
      return Errors::kInternalError;
    }
    if (signature.size() != kG1Size) {
      return Errors::kInvalidSignatureLength;
    }
    if (key.size() != kG2Size) {
      return Errors::kInvalidPublicKeyLength;
    }
    bn::G1 sig;
    if (sig.deserialize(signature.data(), signature.size()) == 0) {
      return Errors::kInvalidSignature;
    }
    bn::G2 public_key;
    if (public_key.deserialize(key.data(), key.size()) == 0) {
      return Errors::kInvalidPublicKey;
    }
    bn::G1 hash;
    bn::hashAndMapToG1(hash, message.data(), message.size());

    // e(sig, g2) == e(H(m), pk)
    bn::GT lhs;
    bn::GT rhs;
    bn::pairing(lhs, sig, curve.generator);
    bn::pairing(rhs, hash, public_key);
    return lhs == rhs;
  }
}  // namespace drand::crypto::bls
