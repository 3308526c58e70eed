/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "chain/chain_options.hpp"
#include "common/logger.hpp"

namespace drand::app {
  using chain::ChainOptions;

  struct Config {
    spdlog::level::level_enum log_level{spdlog::level::info};
    boost::optional<boost::filesystem::path> log_file;

    /** Base url of drand http api */
    std::string url;
    /** Round to fetch, latest when neither round nor time is set */
    boost::optional<Round> round;
    /** Unix time of the round to fetch */
    boost::optional<seconds> time;
    ChainOptions options;

    // offline verification of saved json documents
    boost::optional<boost::filesystem::path> info_file;
    boost::optional<boost::filesystem::path> beacon_file;

    /**
     * Reads command line and optional config file
     * @throws boost::program_options::error on invalid options
     */
    static Config read(int argc, char **argv);

    bool isOffline() const {
      return info_file || beacon_file;
    }
  };

  spdlog::level::level_enum getLogLevel(char level);
}  // namespace drand::app
