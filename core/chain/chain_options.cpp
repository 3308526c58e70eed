/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/chain_options.hpp"

namespace drand::chain {
  bool ChainVerification::verify(const ChainInfo &info) const {
    if (hash && *hash != info.hash) {
      return false;
    }
    if (public_key && *public_key != info.public_key) {
      return false;
    }
    return true;
  }
}  // namespace drand::chain
