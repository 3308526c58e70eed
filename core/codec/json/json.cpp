/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json.hpp"

#include <charconv>

#include <rapidjson/reader.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "common/hexutil.hpp"

namespace drand::codec::json {
  using rapidjson::ParseFlag;
  using rapidjson::StringBuffer;

  namespace {
    template <typename T>
    outcome::result<T> jNumber(JIn j) {
      if (!j->IsString()) {
        return JsonError::kWrongType;
      }
      std::string_view s{j->GetString(), j->GetStringLength()};
      T value{};
      auto [end, ec]{std::from_chars(s.data(), s.data() + s.size(), value)};
      if (ec == std::errc::result_out_of_range) {
        return JsonError::kOutOfRange;
      }
      if (ec != std::errc{} || end != s.data() + s.size()) {
        return JsonError::kWrongType;
      }
      return value;
    }
  }  // namespace

  outcome::result<Document> parse(std::string_view input) {
    Document doc;
    doc.Parse<ParseFlag::kParseNumbersAsStringsFlag>(input.data(),
                                                     input.size());
    if (doc.HasParseError()) {
      return JsonError::kParseError;
    }
    return std::move(doc);
  }

  outcome::result<std::string> format(JIn j) {
    StringBuffer buffer;
    rapidjson::Writer<StringBuffer> writer{buffer};
    if (j->Accept(writer)) {
      return std::string{buffer.GetString(), buffer.GetSize()};
    }
    return JsonError::kWrongType;
  }

  outcome::result<JIn> jGet(JIn j, std::string_view key) {
    if (!j->IsObject()) {
      return JsonError::kWrongType;
    }
    auto it{j->FindMember(
        Value{rapidjson::StringRef(key.data(), key.size())})};
    if (it == j->MemberEnd()) {
      return JsonError::kMissingKey;
    }
    return &it->value;
  }

  bool jHas(JIn j, std::string_view key) {
    auto value{jGet(j, key)};
    return value && !value.value()->IsNull();
  }

  outcome::result<std::string_view> jStr(JIn j) {
    if (j->IsString()) {
      return std::string_view{j->GetString(), j->GetStringLength()};
    }
    return JsonError::kWrongType;
  }

  outcome::result<Bytes> jUnhex(JIn j) {
    OUTCOME_TRY(str, jStr(j));
    return common::unhex(str);
  }

  outcome::result<int64_t> jInt(JIn j) {
    return jNumber<int64_t>(j);
  }

  outcome::result<uint64_t> jUint(JIn j) {
    return jNumber<uint64_t>(j);
  }

  void jSet(Value &j, std::string_view key, Value &&value, Allocator &alloc) {
    j.AddMember(jString(key, alloc), value, alloc);
  }

  Value jString(std::string_view s, Allocator &alloc) {
    return Value{s.data(), static_cast<rapidjson::SizeType>(s.size()), alloc};
  }

  Value jHex(BytesIn bytes, Allocator &alloc) {
    return jString(common::hex_lower(bytes), alloc);
  }
}  // namespace drand::codec::json
