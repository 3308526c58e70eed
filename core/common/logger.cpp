/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace drand::common {
  namespace {
    std::mutex logger_mutex;
    spdlog::sink_ptr file_sink;
  }  // namespace

  Logger createLogger(const std::string &tag) {
    std::lock_guard lock{logger_mutex};
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      logger = spdlog::stderr_color_mt(tag);
      if (file_sink) {
        logger->sinks().push_back(file_sink);
      }
      logger->set_level(spdlog::get_level());
    }
    return logger;
  }

  void logToFile(const std::string &path) {
    std::lock_guard lock{logger_mutex};
    file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
    spdlog::apply_all([](const Logger &logger) {
      logger->sinks().push_back(file_sink);
    });
  }
}  // namespace drand::common
