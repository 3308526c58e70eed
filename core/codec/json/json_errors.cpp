/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(drand::codec::json, JsonError, e) {
  using E = drand::codec::json::JsonError;
  switch (e) {
    case E::kParseError:
      return "malformed json document";
    case E::kWrongType:
      return "wrong type";
    case E::kOutOfRange:
      return "out of range";
    case E::kMissingKey:
      return "missing key";
  }

  return "unknown JsonError error code";
}
