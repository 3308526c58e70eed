/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/hexutil.hpp"

inline std::vector<uint8_t> operator""_unhex(const char *c, size_t s) {
  return drand::common::unhex(std::string_view(c, s)).value();
}

inline drand::common::Hash256 operator""_hash256(const char *c, size_t s) {
  return drand::common::Hash256::fromHex(std::string_view(c, s)).value();
}
