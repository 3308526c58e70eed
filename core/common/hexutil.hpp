/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace drand::common {
  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError { kNotEnoughInput = 1, kNonHexInput, kUnknown };

  /**
   * @brief Converts bytes to hex representation
   * @param bytes array of bytes
   * @return hexdecimal representation in lower case
   */
  std::string hex_lower(BytesIn bytes) noexcept;

  /**
   * @brief Converts hex representation to bytes
   * @param hex hexadecimal string, case insensitive, no "0x" prefix
   * @return bytes or error if input is not a valid hex of even length
   */
  outcome::result<Bytes> unhex(std::string_view hex);
}  // namespace drand::common

OUTCOME_HPP_DECLARE_ERROR(drand::common, UnhexError);
