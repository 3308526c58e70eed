/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/impl/chain_client_impl.hpp"

#include "common/outcome_fmt.hpp"

#define MOVE(x)  \
  x {            \
    std::move(x) \
  }

OUTCOME_CPP_DEFINE_CATEGORY(drand::client, ClientError, e) {
  using E = drand::client::ClientError;
  switch (e) {
    case E::kInvalidChainInfo:
      return "Chain info does not match expected chain";
    case E::kInvalidBeacon:
      return "Beacon verification failed";
  }
  return "unknown ClientError error code";
}

namespace drand::client {
  using beacon::RandomnessBeacon;

  ChainClientImpl::ChainClientImpl(std::shared_ptr<Transport> transport,
                                   std::shared_ptr<BeaconVerifier> verifier,
                                   ChainOptions options)
      : transport_{std::move(transport)},
        verifier_{std::move(verifier)},
        options_{std::move(options)},
        log_{common::createLogger("drand_client")} {}

  void ChainClientImpl::chainInfo(CbT<ChainInfo> cb) {
    if (options_.is_cache) {
      if (auto cached{cachedChainInfo()}) {
        return cb(std::move(*cached));
      }
    }
    transport_->fetchInfo([self{shared_from_this()},
                           MOVE(cb)](outcome::result<ChainInfo> _info) {
      if (!_info) {
        self->log_->error("fetching chain info: {}", _info.error());
        return cb(_info.error());
      }
      auto &info{_info.value()};
      if (!self->options_.verify(info)) {
        self->log_->warn("rejected chain info {}", info.hash.toHex());
        return cb(ClientError::kInvalidChainInfo);
      }
      if (self->options_.is_cache) {
        self->cacheChainInfo(info);
      }
      cb(std::move(info));
    });
  }

  void ChainClientImpl::latest(CbT<TimedBeacon> cb) {
    getBeacon(boost::none, std::move(cb));
  }

  void ChainClientImpl::get(Round round, CbT<TimedBeacon> cb) {
    getBeacon(round, std::move(cb));
  }

  void ChainClientImpl::getByUnixTime(seconds time, CbT<TimedBeacon> cb) {
    chainInfo([self{shared_from_this()}, time, MOVE(cb)](
                  outcome::result<ChainInfo> _info) {
      OUTCOME_CB(auto info, _info);
      OUTCOME_CB(auto round, chain::roundAt(info, time));
      self->get(round, cb);
    });
  }

  const ChainOptions &ChainClientImpl::options() const {
    return options_;
  }

  void ChainClientImpl::getBeacon(boost::optional<Round> round,
                                  CbT<TimedBeacon> cb) {
    transport_->fetchBeacon(
        round,
        !options_.is_cache,
        [self{shared_from_this()},
         MOVE(cb)](outcome::result<RandomnessBeacon> _beacon) {
          if (!_beacon) {
            self->log_->error("fetching beacon: {}", _beacon.error());
            return cb(_beacon.error());
          }
          self->chainInfo([self,
                           beacon{std::move(_beacon.value())},
                           cb](outcome::result<ChainInfo> _info) {
            OUTCOME_CB(auto info, _info);
            if (self->options_.is_beacon_verification) {
              OUTCOME_CB(auto valid, self->verifier_->verify(beacon, info));
              if (!valid) {
                self->log_->warn("rejected beacon of round {}", beacon.round());
                return cb(ClientError::kInvalidBeacon);
              }
            }
            OUTCOME_CB(auto time, chain::roundTime(info, beacon.round()));
            cb(TimedBeacon{beacon, time});
          });
        });
  }

  boost::optional<ChainInfo> ChainClientImpl::cachedChainInfo() const {
    std::lock_guard lock{chain_info_mutex_};
    return chain_info_;
  }

  void ChainClientImpl::cacheChainInfo(const ChainInfo &info) {
    std::lock_guard lock{chain_info_mutex_};
    if (!chain_info_) {
      chain_info_ = info;
    }
  }
}  // namespace drand::client
