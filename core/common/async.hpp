/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include "common/outcome.hpp"

namespace drand {
  /// Receives result of an asynchronous operation
  template <typename T>
  using CbT = std::function<void(outcome::result<T>)>;
}  // namespace drand

/**
 * Inside a lambda with a callback `cb`:
 * OUTCOME_CB(auto value, result); // passes error to cb and returns
 */
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_CB1(u, r)  \
  auto && (u){r};           \
  if (!(u)) {               \
    return cb((u).error()); \
  }
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_CB(u, l, r) \
  _OUTCOME_CB1(u, r)         \
  l = std::move((u).value());  // NOLINT(bugprone-macro-parentheses)
#define OUTCOME_CB(l, r) _OUTCOME_CB(BOOST_OUTCOME_TRY_UNIQUE_NAME, l, r)
