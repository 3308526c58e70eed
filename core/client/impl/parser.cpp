/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/impl/parser.hpp"

#include "codec/json/json.hpp"
#include "common/visitor.hpp"

namespace drand::client {
  using codec::json::Allocator;
  using codec::json::Document;
  using codec::json::JIn;
  using codec::json::Value;
  using beacon::ChainedBeacon;
  using beacon::UnchainedBeacon;
  namespace json = codec::json;

  namespace {
    constexpr std::string_view kPublicKey{"public_key"};
    constexpr std::string_view kPeriod{"period"};
    constexpr std::string_view kGenesisTime{"genesis_time"};
    constexpr std::string_view kHash{"hash"};
    constexpr std::string_view kGroupHash{"groupHash"};
    constexpr std::string_view kSchemeId{"schemeID"};
    constexpr std::string_view kMetadata{"metadata"};
    constexpr std::string_view kBeaconId{"beaconID"};
    constexpr std::string_view kRound{"round"};
    constexpr std::string_view kRandomness{"randomness"};
    constexpr std::string_view kSignature{"signature"};
    constexpr std::string_view kPreviousSignature{"previous_signature"};
    constexpr std::string_view kTime{"time"};

    outcome::result<Bytes> hexField(JIn j, std::string_view key) {
      OUTCOME_TRY(value, json::jGet(j, key));
      return json::jUnhex(value);
    }

    outcome::result<std::string> strField(JIn j, std::string_view key) {
      OUTCOME_TRY(value, json::jGet(j, key));
      OUTCOME_TRY(str, json::jStr(value));
      return std::string{str};
    }

    outcome::result<common::Hash256> hashField(JIn j, std::string_view key) {
      OUTCOME_TRY(bytes, hexField(j, key));
      return common::Hash256::fromSpan(bytes);
    }

    void encodeBeaconFields(const RandomnessBeacon &randomness_beacon,
                            Value &j,
                            Allocator &alloc) {
      json::jSet(j, kRound, Value{randomness_beacon.round()}, alloc);
      json::jSet(j,
                 kRandomness,
                 json::jHex(randomness_beacon.randomness(), alloc),
                 alloc);
      json::jSet(j,
                 kSignature,
                 json::jHex(randomness_beacon.signature(), alloc),
                 alloc);
      visit_in_place(
          randomness_beacon,
          [&](const ChainedBeacon &chained) {
            json::jSet(j,
                       kPreviousSignature,
                       json::jHex(chained.previous_signature, alloc),
                       alloc);
          },
          [](const UnchainedBeacon &) {});
    }
  }  // namespace

  outcome::result<ChainInfo> JsonParser::parseChainInfo(
      std::string_view input) {
    OUTCOME_TRY(doc, json::parse(input));
    const JIn j{&doc};

    ChainInfo info;
    OUTCOME_TRY(public_key, hexField(j, kPublicKey));
    info.public_key = std::move(public_key);
    OUTCOME_TRY(j_period, json::jGet(j, kPeriod));
    OUTCOME_TRY(period, json::jUint(j_period));
    info.period = seconds{period};
    OUTCOME_TRY(j_genesis, json::jGet(j, kGenesisTime));
    OUTCOME_TRY(genesis_time, json::jInt(j_genesis));
    info.genesis_time = seconds{genesis_time};
    OUTCOME_TRY(hash, hashField(j, kHash));
    info.hash = hash;
    OUTCOME_TRY(group_hash, hashField(j, kGroupHash));
    info.group_hash = group_hash;
    // networks created before unchained randomness do not publish scheme
    if (json::jHas(j, kSchemeId)) {
      OUTCOME_TRY(scheme_id, strField(j, kSchemeId));
      info.scheme_id = std::move(scheme_id);
    }
    if (json::jHas(j, kMetadata)) {
      OUTCOME_TRY(metadata, json::jGet(j, kMetadata));
      if (json::jHas(metadata, kBeaconId)) {
        OUTCOME_TRY(beacon_id, strField(metadata, kBeaconId));
        info.beacon_id = std::move(beacon_id);
      }
    }
    return info;
  }

  outcome::result<RandomnessBeacon> JsonParser::parseBeacon(
      std::string_view input) {
    OUTCOME_TRY(doc, json::parse(input));
    const JIn j{&doc};

    OUTCOME_TRY(j_round, json::jGet(j, kRound));
    OUTCOME_TRY(round, json::jUint(j_round));
    OUTCOME_TRY(randomness, hexField(j, kRandomness));
    OUTCOME_TRY(signature, hexField(j, kSignature));
    if (json::jHas(j, kPreviousSignature)) {
      OUTCOME_TRY(previous_signature, hexField(j, kPreviousSignature));
      return ChainedBeacon{round,
                           std::move(randomness),
                           std::move(signature),
                           std::move(previous_signature)};
    }
    return UnchainedBeacon{round, std::move(randomness), std::move(signature)};
  }

  outcome::result<std::string> JsonParser::encodeChainInfo(
      const ChainInfo &info) {
    Document doc;
    doc.SetObject();
    auto &alloc{doc.GetAllocator()};
    json::jSet(doc, kPublicKey, json::jHex(info.public_key, alloc), alloc);
    json::jSet(doc,
               kPeriod,
               Value{static_cast<uint64_t>(info.period.count())},
               alloc);
    json::jSet(doc,
               kGenesisTime,
               Value{static_cast<int64_t>(info.genesis_time.count())},
               alloc);
    json::jSet(doc, kHash, json::jHex(info.hash, alloc), alloc);
    json::jSet(doc, kGroupHash, json::jHex(info.group_hash, alloc), alloc);
    json::jSet(doc, kSchemeId, json::jString(info.scheme_id, alloc), alloc);
    Value metadata{rapidjson::kObjectType};
    json::jSet(
        metadata, kBeaconId, json::jString(info.beacon_id, alloc), alloc);
    json::jSet(doc, kMetadata, std::move(metadata), alloc);
    return json::format(&doc);
  }

  outcome::result<std::string> JsonParser::encodeBeacon(
      const RandomnessBeacon &beacon) {
    Document doc;
    doc.SetObject();
    encodeBeaconFields(beacon, doc, doc.GetAllocator());
    return json::format(&doc);
  }

  outcome::result<std::string> JsonParser::encodeTimedBeacon(
      const TimedBeacon &timed) {
    Document doc;
    doc.SetObject();
    auto &alloc{doc.GetAllocator()};
    encodeBeaconFields(timed.beacon, doc, alloc);
    json::jSet(
        doc, kTime, Value{static_cast<int64_t>(timed.time.count())}, alloc);
    return json::format(&doc);
  }
}  // namespace drand::client
