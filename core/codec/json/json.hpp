/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <rapidjson/document.h>

#include "codec/json/json_errors.hpp"
#include "common/bytes.hpp"

namespace drand::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;
  using JIn = const Value *;
  using Allocator = rapidjson::MemoryPoolAllocator<>;

  /// Parses document, numbers are kept as strings to preserve 64-bit values
  outcome::result<Document> parse(std::string_view input);

  outcome::result<std::string> format(JIn j);

  outcome::result<JIn> jGet(JIn j, std::string_view key);

  bool jHas(JIn j, std::string_view key);

  outcome::result<std::string_view> jStr(JIn j);

  outcome::result<Bytes> jUnhex(JIn j);

  outcome::result<int64_t> jInt(JIn j);

  outcome::result<uint64_t> jUint(JIn j);

  void jSet(Value &j, std::string_view key, Value &&value, Allocator &alloc);

  Value jString(std::string_view s, Allocator &alloc);

  Value jHex(BytesIn bytes, Allocator &alloc);
}  // namespace drand::codec::json
