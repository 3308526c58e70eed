/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/random/mersenne_twister.hpp>

#include "client/transport.hpp"

namespace drand::client {
  using boost::asio::io_context;

  enum class HttpError {
    kMissingScheme = 1,
    kUnsupportedScheme,
    kInvalidUrl,
    kBadStatus,
  };

  /// Endpoint of a drand http api
  struct Url {
    std::string host;
    std::string port;
    /// Always ends with '/'
    std::string path;
  };

  /**
   * Parses base url of the api, "http://host[:port][/path]"
   */
  outcome::result<Url> parseUrl(std::string_view url);

  /// Request target of chain info
  std::string infoTarget(const Url &url);

  /**
   * Request target of a beacon
   * @param round - none for the latest beacon
   * @param cache_key - appended as query so intermediate caches miss
   */
  std::string beaconTarget(const Url &url,
                           boost::optional<Round> round,
                           boost::optional<uint64_t> cache_key);

  /**
   * Transport over drand http api
   */
  class HttpTransport : public Transport {
   public:
    HttpTransport(io_context &io, Url url);

    void fetchInfo(CbT<ChainInfo> cb) override;

    void fetchBeacon(boost::optional<Round> round,
                     bool bust_cache,
                     CbT<RandomnessBeacon> cb) override;

   private:
    io_context &io_;
    Url url_;
    boost::random::mt19937_64 cache_keys_;
  };
}  // namespace drand::client

OUTCOME_HPP_DECLARE_ERROR(drand::client, HttpError);
