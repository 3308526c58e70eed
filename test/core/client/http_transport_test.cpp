/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/impl/http_transport.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

namespace drand::client {
  /**
   * @given url with host only
   * @when parsing it
   * @then default port and root path are used
   */
  TEST(HttpUrlTest, HostOnly) {
    EXPECT_OUTCOME_TRUE(url, parseUrl("http://api.drand.sh"));
    EXPECT_EQ(url.host, "api.drand.sh");
    EXPECT_EQ(url.port, "80");
    EXPECT_EQ(url.path, "/");
    EXPECT_EQ(infoTarget(url), "/info");
  }

  /**
   * @given url with port and path of a chain
   * @when parsing it
   * @then targets are relative to the path
   */
  TEST(HttpUrlTest, PortAndPath) {
    EXPECT_OUTCOME_TRUE(url, parseUrl("http://localhost:8080/chain/7672"));
    EXPECT_EQ(url.host, "localhost");
    EXPECT_EQ(url.port, "8080");
    EXPECT_EQ(url.path, "/chain/7672/");
    EXPECT_EQ(infoTarget(url), "/chain/7672/info");
    EXPECT_EQ(beaconTarget(url, Round{5}, boost::none),
              "/chain/7672/public/5");
  }

  /**
   * @given beacon requests with and without cache key
   * @when building targets
   * @then latest round is named and key is appended as query
   */
  TEST(HttpUrlTest, BeaconTarget) {
    EXPECT_OUTCOME_TRUE(url, parseUrl("http://api.drand.sh/"));
    EXPECT_EQ(beaconTarget(url, boost::none, boost::none), "/public/latest");
    EXPECT_EQ(beaconTarget(url, boost::none, uint64_t{42}),
              "/public/latest?42");
    EXPECT_EQ(beaconTarget(url, Round{1000000}, uint64_t{7}),
              "/public/1000000?7");
  }

  /**
   * @given urls without scheme, with unsupported scheme and malformed port
   * @when parsing them
   * @then errors are returned
   */
  TEST(HttpUrlTest, Errors) {
    EXPECT_OUTCOME_ERROR(HttpError::kMissingScheme, parseUrl("api.drand.sh"));
    EXPECT_OUTCOME_ERROR(HttpError::kUnsupportedScheme,
                         parseUrl("https://api.drand.sh"));
    EXPECT_OUTCOME_ERROR(HttpError::kInvalidUrl,
                         parseUrl("http://api.drand.sh:port"));
    EXPECT_OUTCOME_ERROR(HttpError::kInvalidUrl, parseUrl("http:///info"));
  }
}  // namespace drand::client
