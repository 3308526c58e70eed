/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <memory>
#include <mutex>

#include "client/chain_client.hpp"
#include "client/transport.hpp"
#include "common/logger.hpp"
#include "verifier/verifier.hpp"

namespace drand::client {
  using verifier::BeaconVerifier;

  class ChainClientImpl
      : public ChainClient,
        public std::enable_shared_from_this<ChainClientImpl> {
   public:
    ChainClientImpl(std::shared_ptr<Transport> transport,
                    std::shared_ptr<BeaconVerifier> verifier,
                    ChainOptions options);

    void chainInfo(CbT<ChainInfo> cb) override;

    void latest(CbT<TimedBeacon> cb) override;

    void get(Round round, CbT<TimedBeacon> cb) override;

    void getByUnixTime(seconds time, CbT<TimedBeacon> cb) override;

    const ChainOptions &options() const override;

   private:
    void getBeacon(boost::optional<Round> round, CbT<TimedBeacon> cb);

    boost::optional<ChainInfo> cachedChainInfo() const;

    void cacheChainInfo(const ChainInfo &info);

    std::shared_ptr<Transport> transport_;
    std::shared_ptr<BeaconVerifier> verifier_;
    ChainOptions options_;

    /** Set by the first verified fetch when caching is enabled */
    mutable std::mutex chain_info_mutex_;
    boost::optional<ChainInfo> chain_info_;

    common::Logger log_;
  };
}  // namespace drand::client
