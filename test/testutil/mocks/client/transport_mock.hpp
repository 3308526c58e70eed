/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "client/transport.hpp"

namespace drand::client {
  class TransportMock : public Transport {
   public:
    MOCK_METHOD1(fetchInfo, void(CbT<ChainInfo>));

    MOCK_METHOD3(fetchBeacon,
                 void(boost::optional<Round>, bool, CbT<RandomnessBeacon>));
  };
}  // namespace drand::client
