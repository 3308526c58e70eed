/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/fmt.h>
#include <system_error>

/**
 * Error codes in log messages:
 * log->error("fetching: {}", ec); // fetching: CATEGORY error VALUE "MESSAGE"
 */
template <>
struct fmt::formatter<std::error_code, char, void> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext &ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const std::error_code &e, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(),
                          "{} error {}: \"{}\"",
                          e.category().name(),
                          e.value(),
                          e.message());
  }
};
