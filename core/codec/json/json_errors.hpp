/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace drand::codec::json {
  enum class JsonError {
    kParseError = 1,
    kWrongType,
    kOutOfRange,
    kMissingKey,
  };
}  // namespace drand::codec::json

OUTCOME_HPP_DECLARE_ERROR(drand::codec::json, JsonError);
