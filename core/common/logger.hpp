/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/spdlog.h>

namespace drand::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object, writing to stderr and to the log file if one is set
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /// Copies output of existing and future loggers to file
  void logToFile(const std::string &path);
}  // namespace drand::common
