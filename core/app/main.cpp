/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <boost/asio/io_context.hpp>
#include <boost/program_options/errors.hpp>
#include <iostream>

#include "app/config.hpp"
#include "client/impl/chain_client_impl.hpp"
#include "client/impl/http_transport.hpp"
#include "client/impl/parser.hpp"
#include "common/file.hpp"
#include "common/outcome_fmt.hpp"
#include "verifier/impl/verifier_impl.hpp"

namespace drand::app {
  using beacon::TimedBeacon;
  using client::ClientError;
  using client::JsonParser;

  /// Process exit codes
  enum Exit : int {
    kValid = 0,
    kInvalid = 1,
    kFailure = 2,
  };

  common::Logger log() {
    static const auto logger{common::createLogger("drand_verify")};
    return logger;
  }

  Exit print(const TimedBeacon &beacon) {
    auto _json{JsonParser::encodeTimedBeacon(beacon)};
    if (!_json) {
      log()->error("encoding beacon: {}", _json.error());
      return kFailure;
    }
    std::cout << _json.value() << std::endl;
    return kValid;
  }

  outcome::result<bool> verifyFiles(const Config &config,
                                    TimedBeacon &beacon) {
    OUTCOME_TRY(info_json, common::readFile(*config.info_file));
    OUTCOME_TRY(info, JsonParser::parseChainInfo(info_json));
    OUTCOME_TRY(beacon_json, common::readFile(*config.beacon_file));
    OUTCOME_TRY(randomness_beacon, JsonParser::parseBeacon(beacon_json));
    OUTCOME_TRY(time, chain::roundTime(info, randomness_beacon.round()));
    beacon = TimedBeacon{randomness_beacon, time};
    if (!config.options.verify(info)) {
      log()->warn("chain info {} is not the expected chain",
                  info.hash.toHex());
      return false;
    }
    if (!config.options.is_beacon_verification) {
      return true;
    }
    return verifier::BeaconVerifierImpl{}.verify(randomness_beacon, info);
  }

  Exit runOffline(const Config &config) {
    TimedBeacon beacon;
    auto _valid{verifyFiles(config, beacon)};
    if (!_valid) {
      log()->error("offline verification: {}", _valid.error());
      return kFailure;
    }
    if (!_valid.value()) {
      log()->warn("beacon of round {} is invalid", beacon.beacon.round());
      return kInvalid;
    }
    return print(beacon);
  }

  Exit runOnline(const Config &config) {
    auto _url{client::parseUrl(config.url)};
    if (!_url) {
      log()->error("url {}: {}", config.url, _url.error());
      return kFailure;
    }
    boost::asio::io_context io;
    auto client{std::make_shared<client::ChainClientImpl>(
        std::make_shared<client::HttpTransport>(io, std::move(_url.value())),
        std::make_shared<verifier::BeaconVerifierImpl>(),
        config.options)};

    boost::optional<outcome::result<TimedBeacon>> result;
    auto cb{[&](outcome::result<TimedBeacon> _beacon) {
      result = std::move(_beacon);
    }};
    if (config.time) {
      client->getByUnixTime(*config.time, cb);
    } else if (config.round) {
      client->get(*config.round, cb);
    } else {
      client->latest(cb);
    }
    io.run();

    if (!result) {
      log()->error("no response from {}", config.url);
      return kFailure;
    }
    if (!*result) {
      const auto &ec{result->error()};
      if (ec == ClientError::kInvalidBeacon
          || ec == ClientError::kInvalidChainInfo) {
        return kInvalid;
      }
      log()->error("fetching beacon: {}", ec);
      return kFailure;
    }
    return print(result->value());
  }
}  // namespace drand::app

int main(int argc, char *argv[]) {
  using drand::app::Config;
  Config config;
  try {
    config = Config::read(argc, argv);
  } catch (const boost::program_options::error &e) {
    std::cerr << e.what() << std::endl;
    return drand::app::kFailure;
  }

  spdlog::set_level(config.log_level);
  if (config.log_file) {
    drand::common::logToFile(config.log_file->string());
  }

  if (config.isOffline()) {
    return drand::app::runOffline(config);
  }
  return drand::app::runOnline(config);
}
