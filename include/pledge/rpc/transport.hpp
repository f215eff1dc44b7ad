#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pledge::rpc {

enum class http_method : uint8_t { get = 0, post = 1 };

enum class transport_status : uint8_t {
  ok = 0,               // an HTTP response arrived, whatever its status
  connect_failed = 1,   // no connection was made; nothing was sent
  exchange_failed = 2,  // connected, but the exchange broke off
  timed_out = 3,
};

struct http_request final {
  http_method method{http_method::get};
  std::string url;
  // Appended as ?name=value&..., each part URL-escaped by the transport.
  std::vector<std::pair<std::string, std::string>> query;
  std::string content_type;
  std::string body;
};

struct http_response final {
  transport_status status{transport_status::ok};
  int64_t status_code{};
  std::string body;
  std::string error;  // transport-level failure text
};

/// One blocking HTTP exchange. Never throws; failures are reported in
/// http_response::status.
using transport_t = std::function<http_response(const http_request&)>;

/// libcurl easy-interface transport bounded by `timeout` per request.
transport_t make_curl_transport(std::chrono::milliseconds timeout);

/// `url` without trailing slashes.
std::string trim_endpoint(std::string_view url);

}  // namespace pledge::rpc
