/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/impl/http_transport.hpp"

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/random/random_device.hpp>

#include "client/impl/parser.hpp"

#define MOVE(x)  \
  x {            \
    std::move(x) \
  }

#define EC_CB()    \
  if (ec) {        \
    return cb(ec); \
  }

namespace drand::client {
  namespace beast = boost::beast;
  namespace http = beast::http;
  namespace net = boost::asio;
  using tcp = net::ip::tcp;

  namespace {
    constexpr std::string_view kHttp{"http://"};
    constexpr std::string_view kSchemeSeparator{"://"};
    constexpr auto kTimeout{std::chrono::seconds(5)};

    template <typename Parse, typename T>
    inline auto withParser(Parse &&parse, CbT<T> cb) {
      return [parse{std::forward<Parse>(parse)},
              MOVE(cb)](outcome::result<std::string> _body) {
        OUTCOME_CB(auto body, _body);
        cb(parse(body));
      };
    }

    struct ClientSession {
      explicit ClientSession(io_context &io)
          : resolver{io}, stream{net::make_strand(io)} {}
      ClientSession(const ClientSession &) = delete;
      ClientSession(ClientSession &&) = delete;
      ~ClientSession() {
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
      }
      ClientSession &operator=(const ClientSession &) = delete;
      ClientSession &operator=(ClientSession &&) = delete;

      static void get(io_context &io,
                      const Url &url,
                      const std::string &target,
                      CbT<std::string> cb) {
        auto s{std::make_shared<ClientSession>(io)};
        s->req.method(http::verb::get);
        s->req.target(target);
        s->req.set(http::field::host, url.host);
        s->req.set(http::field::accept, "application/json");
        s->stream.expires_after(kTimeout);
        s->resolver.async_resolve(
            url.host, url.port, [s, MOVE(cb)](auto &&ec, auto &&iterator) {
              EC_CB();
              s->stream.async_connect(
                  iterator, [s, MOVE(cb)](auto &&ec, auto &&) {
                    EC_CB();
                    http::async_write(
                        s->stream, s->req, [s, MOVE(cb)](auto &&ec, auto &&) {
                          EC_CB();
                          http::async_read(
                              s->stream,
                              s->buffer,
                              s->res,
                              [s, MOVE(cb)](auto &&ec, auto &&) {
                                EC_CB();
                                if (s->res.result() != http::status::ok) {
                                  return cb(HttpError::kBadStatus);
                                }
                                cb(std::move(s->res.body()));
                              });
                        });
                  });
            });
      }

      tcp::resolver resolver;
      beast::tcp_stream stream;
      http::request<http::empty_body> req;
      beast::flat_buffer buffer;
      http::response<http::string_body> res;
    };
  }  // namespace

  outcome::result<Url> parseUrl(std::string_view url) {
    if (url.substr(0, kHttp.size()) != kHttp) {
      if (url.find(kSchemeSeparator) == std::string_view::npos) {
        return HttpError::kMissingScheme;
      }
      return HttpError::kUnsupportedScheme;
    }
    url.remove_prefix(kHttp.size());

    Url result;
    const auto path_begin{url.find('/')};
    auto authority{url.substr(0, path_begin)};
    result.path = path_begin == std::string_view::npos
                      ? "/"
                      : std::string{url.substr(path_begin)};
    if (result.path.back() != '/') {
      result.path += '/';
    }

    const auto colon{authority.find(':')};
    if (colon == std::string_view::npos) {
      result.port = "80";
    } else {
      result.port = std::string{authority.substr(colon + 1)};
      authority = authority.substr(0, colon);
      if (result.port.empty()
          || result.port.find_first_not_of("0123456789")
                 != std::string::npos) {
        return HttpError::kInvalidUrl;
      }
    }
    if (authority.empty()) {
      return HttpError::kInvalidUrl;
    }
    result.host = std::string{authority};
    return result;
  }

  std::string infoTarget(const Url &url) {
    return url.path + "info";
  }

  std::string beaconTarget(const Url &url,
                           boost::optional<Round> round,
                           boost::optional<uint64_t> cache_key) {
    auto target{url.path + "public/"};
    if (round) {
      target += std::to_string(*round);
    } else {
      target += "latest";
    }
    if (cache_key) {
      target += "?" + std::to_string(*cache_key);
    }
    return target;
  }

  HttpTransport::HttpTransport(io_context &io, Url url)
      : io_{io}, url_{std::move(url)}, cache_keys_{boost::random_device{}()} {}

  void HttpTransport::fetchInfo(CbT<ChainInfo> cb) {
    ClientSession::get(io_,
                       url_,
                       infoTarget(url_),
                       withParser(
                           [](const std::string &body) {
                             return JsonParser::parseChainInfo(body);
                           },
                           std::move(cb)));
  }

  void HttpTransport::fetchBeacon(boost::optional<Round> round,
                                  bool bust_cache,
                                  CbT<RandomnessBeacon> cb) {
    boost::optional<uint64_t> cache_key;
    if (bust_cache) {
      cache_key = cache_keys_();
    }
    ClientSession::get(io_,
                       url_,
                       beaconTarget(url_, round, cache_key),
                       withParser(
                           [](const std::string &body) {
                             return JsonParser::parseBeacon(body);
                           },
                           std::move(cb)));
  }
}  // namespace drand::client

OUTCOME_CPP_DEFINE_CATEGORY(drand::client, HttpError, e) {
  using E = drand::client::HttpError;
  switch (e) {
    case E::kMissingScheme:
      return "Url has no scheme, add http:// in front of it";
    case E::kUnsupportedScheme:
      return "Only http:// urls are supported";
    case E::kInvalidUrl:
      return "Invalid url";
    case E::kBadStatus:
      return "Http response status is not 200";
  }
  return "unknown HttpError error code";
}
