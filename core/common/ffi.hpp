/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <memory>

#include "common/blob.hpp"

namespace drand::common::ffi {
  /// Owns response allocated by C library, released with its destructor
  template <typename T, typename D>
  auto wrap(T *ptr, D deleter) {
    return std::unique_ptr<T, D>(ptr, deleter);
  }

  template <size_t size>
  auto array(const uint8_t (&rhs)[size]) {
    Blob<size> lhs;
    std::copy(std::begin(rhs), std::end(rhs), std::begin(lhs));
    return lhs;
  }
}  // namespace drand::common::ffi
