#pragma once

#include <pledge/rpc/transport.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pledge::testing {

/// In-process stand-in for the HTTP transport: replays `responses` in order
/// and records every request it receives. Once the script runs out every
/// further request fails to connect.
struct scripted_transport final {
  std::vector<pledge::rpc::http_response> responses;
  std::vector<pledge::rpc::http_request> requests;
};

inline pledge::rpc::transport_t make_transport(
    const std::shared_ptr<scripted_transport>& script) {
  return [script](const pledge::rpc::http_request& request) {
    script->requests.push_back(request);
    auto index = script->requests.size() - 1;
    if (index >= script->responses.size()) {
      return pledge::rpc::http_response{
          .status = pledge::rpc::transport_status::connect_failed,
          .error = "no scripted response"};
    }
    return script->responses[index];
  };
}

inline pledge::rpc::http_response make_http_response(
    std::string body,
    const int64_t status_code = 200) {
  return pledge::rpc::http_response{.status_code = status_code,
                                    .body = std::move(body)};
}

inline pledge::rpc::http_response make_connection_failure() {
  return pledge::rpc::http_response{
      .status = pledge::rpc::transport_status::connect_failed,
      .error = "Couldn't connect to server"};
}

/// The node accepted the connection and then dropped it mid-exchange.
inline pledge::rpc::http_response make_receive_failure() {
  return pledge::rpc::http_response{
      .status = pledge::rpc::transport_status::exchange_failed,
      .error = "Recv failure: Connection reset by peer"};
}

inline pledge::rpc::http_response make_timeout() {
  return pledge::rpc::http_response{
      .status = pledge::rpc::transport_status::timed_out,
      .error = "Operation timed out after 30000 milliseconds"};
}

inline std::string make_broadcast_body(const uint32_t check_code,
                                       const std::string& check_log,
                                       const uint32_t deliver_code,
                                       const std::string& deliver_log) {
  return fmt::format(
      R"({{"jsonrpc":"2.0","id":"1","result":{{"check_tx":{{"code":{},"log":"{}"}},)"
      R"("deliver_tx":{{"code":{},"log":"{}"}},"hash":"ABCD","height":"42"}}}})",
      check_code, check_log, deliver_code, deliver_log);
}

inline std::string make_query_body(const std::string& value_b64,
                                   const uint32_t code = 0,
                                   const std::string& log = "") {
  return fmt::format(
      R"({{"jsonrpc":"2.0","id":-1,"result":{{"response":{{"code":{},"log":"{}",)"
      R"("info":"","index":"0","key":null,"value":"{}","proofOps":null,)"
      R"("height":"7","codespace":""}}}}}})",
      code, log, value_b64);
}

}  // namespace pledge::testing
