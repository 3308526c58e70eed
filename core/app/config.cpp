/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/config.hpp"

#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>

#include "common/hexutil.hpp"

namespace drand::common {
  template <size_t N>
  inline void validate(boost::any &out,
                       const std::vector<std::string> &values,
                       Blob<N> *,
                       long) {
    using namespace boost::program_options;
    check_first_occurrence(out);
    auto &value{get_single_string(values)};
    if (auto _bytes{Blob<N>::fromHex(value)}) {
      out = _bytes.value();
      return;
    }
    boost::throw_exception(invalid_option_value{value});
  }
}  // namespace drand::common

namespace drand::app {
  namespace po = boost::program_options;

  constexpr auto kDefaultUrl{"http://api.drand.sh"};

  spdlog::level::level_enum getLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
    }
    return spdlog::level::info;
  }

  Config Config::read(int argc, char **argv) {
    Config config;
    struct {
      char log_level;
      boost::optional<int64_t> time;
      boost::optional<common::Hash256> chain_hash;
      boost::optional<std::string> public_key;
      boost::optional<boost::filesystem::path> config_file;
      bool no_verify{false};
      bool no_cache{false};
    } raw;
    po::options_description desc("drand_verify options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("config", po::value(&raw.config_file), "read options from file");
    option("url",
           po::value(&config.url)->default_value(kDefaultUrl),
           "drand http api url");
    option("round", po::value(&config.round), "round to fetch, default latest");
    option("time", po::value(&raw.time), "fetch round emitted at unix time");
    option("log,l",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    option("log-file", po::value(&config.log_file), "also write log to file");

    po::options_description chain_desc("Chain options");
    auto chain_option{chain_desc.add_options()};
    chain_option("chain-hash",
                 po::value(&raw.chain_hash),
                 "expected chain hash (hex)");
    chain_option("public-key",
                 po::value(&raw.public_key),
                 "expected chain public key (hex)");
    chain_option("no-verify",
                 po::bool_switch(&raw.no_verify),
                 "do not verify beacons");
    chain_option("no-cache",
                 po::bool_switch(&raw.no_cache),
                 "do not cache chain info and beacons");
    desc.add(chain_desc);

    po::options_description offline_desc("Offline verification");
    auto offline_option{offline_desc.add_options()};
    offline_option("info-file",
                   po::value(&config.info_file),
                   "chain info json, as returned by /info");
    offline_option("beacon-file",
                   po::value(&config.beacon_file),
                   "beacon json, as returned by /public/{round}");
    desc.add(offline_desc);

    po::variables_map vm;
    po::store(parse_command_line(argc, argv, desc), vm);
    if (vm.count("help") != 0) {
      std::cerr << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    po::notify(vm);
    if (raw.config_file) {
      std::ifstream config_file{raw.config_file->c_str()};
      if (!config_file.good()) {
        boost::throw_exception(po::reading_file{raw.config_file->c_str()});
      }
      po::store(po::parse_config_file(config_file, desc), vm);
      po::notify(vm);
    }

    config.log_level = getLogLevel(raw.log_level);

    if (config.round && raw.time) {
      boost::throw_exception(
          po::error{"options '--round' and '--time' are mutually exclusive"});
    }
    if (raw.time) {
      config.time = seconds{*raw.time};
    }
    if (config.isOffline() && !(config.info_file && config.beacon_file)) {
      boost::throw_exception(po::error{
          "offline verification needs both '--info-file' and '--beacon-file'"});
    }

    config.options.is_beacon_verification = !raw.no_verify;
    config.options.is_cache = !raw.no_cache;
    config.options.chain_verification.hash = raw.chain_hash;
    if (raw.public_key) {
      auto _key{common::unhex(*raw.public_key)};
      if (!_key) {
        boost::throw_exception(po::invalid_option_value{*raw.public_key});
      }
      config.options.chain_verification.public_key = std::move(_key.value());
    }
    return config;
  }
}  // namespace drand::app
