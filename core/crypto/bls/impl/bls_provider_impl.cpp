/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bls/impl/bls_provider_impl.hpp"

#include <filecoin-ffi/filcrypto.h>

#include "common/ffi.hpp"

namespace drand::crypto::bls {
  outcome::result<bool> BlsProviderImpl::verifySignature(
      BytesIn message, BytesIn signature, BytesIn key) const {
    if (signature.size() != kG2Size) {
      return Errors::kInvalidSignatureLength;
    }
    if (key.size() != kG1Size) {
      return Errors::kInvalidPublicKeyLength;
    }
    OUTCOME_TRY(digest, generateHash(message));
    return fil_verify(signature.data(),
                      digest.data(),
                      digest.size(),
                      key.data(),
                      key.size())
           > 0;
  }

  outcome::result<Digest> BlsProviderImpl::generateHash(BytesIn message) {
    auto response{common::ffi::wrap(fil_hash(message.data(), message.size()),
                                    fil_destroy_hash_response)};
    if (response == nullptr) {
      return Errors::kInternalError;
    }
    return common::ffi::array(response->digest.inner);
  }
}  // namespace drand::crypto::bls

OUTCOME_CPP_DEFINE_CATEGORY(drand::crypto::bls, Errors, e) {
  using drand::crypto::bls::Errors;
  switch (e) {
    case (Errors::kInternalError):
      return "BLS provider: internal error";
    case (Errors::kInvalidSignatureLength):
      return "BLS provider: signature has wrong length for its group";
    case (Errors::kInvalidPublicKeyLength):
      return "BLS provider: public key has wrong length for its group";
    case (Errors::kInvalidSignature):
      return "BLS provider: signature is not a valid curve point";
    case (Errors::kInvalidPublicKey):
      return "BLS provider: public key is not a valid curve point";
    default:
      return "BLS provider: unknown error";
  }
}
