/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/outcome.hpp"

namespace drand::crypto::bls {
  /// Compressed point sizes on BLS12-381
  constexpr size_t kG1Size = 48;
  constexpr size_t kG2Size = 96;

  using G1Point = common::Blob<kG1Size>;
  using G2Point = common::Blob<kG2Size>;
  using Digest = common::Blob<kG2Size>;

  enum class Errors {
    kInternalError = 1,
    kInvalidSignatureLength,
    kInvalidPublicKeyLength,
    kInvalidSignature,
    kInvalidPublicKey,
  };
}  // namespace drand::crypto::bls

OUTCOME_HPP_DECLARE_ERROR(drand::crypto::bls, Errors);
