/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <string_view>

#include "common/hexutil.hpp"

namespace drand::common {
  enum class BlobError { kIncorrectLength = 1 };
}  // namespace drand::common

OUTCOME_HPP_DECLARE_ERROR(drand::common, BlobError);

namespace drand::common {
  /**
   * Base type which represents blob of fixed size.
   *
   * std::string is usually used to store hex representation of bytes, so
   * blob is an array of bytes with conversions from hex and from spans of
   * arbitrary length.
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
   public:
    /**
     * Initialize blob value
     */
    constexpr Blob() : std::array<uint8_t, size_>{} {}

    /**
     * @brief constructor enabling initializer list
     * @param l initializer list
     */
    explicit constexpr Blob(const std::array<uint8_t, size_> &l)
        : std::array<uint8_t, size_>{l} {}

    /**
     * In compile-time returns size of current blob.
     */
    static constexpr size_t size() {
      return size_;
    }

    /**
     * Converts current blob to hex string.
     */
    std::string toHex() const noexcept {
      return hex_lower(*this);
    }

    /**
     * Create Blob from arbitrary span
     * @param span of bytes
     * @return result containing Blob object if span has matching size
     */
    static outcome::result<Blob<size_>> fromSpan(BytesIn span) {
      if (span.size() != size_) {
        return BlobError::kIncorrectLength;
      }

      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }

    /**
     * Create Blob from hex string
     * @param hex hex string
     * @return result containing Blob object if hex string has proper size and
     * is in hex format
     */
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(res, unhex(hex));
      return fromSpan(res);
    }
  };

  using Hash256 = Blob<32>;
}  // namespace drand::common
