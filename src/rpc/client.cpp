#include <pledge/common/unique_id.hpp>
#include <pledge/query/path.hpp>
#include <pledge/rpc/classifier.hpp>
#include <pledge/rpc/client.hpp>
#include <pledge/schema/encoding/json/primitives.hpp>

#include <json/json.h>
#include <spdlog/spdlog.h>

namespace pledge::rpc {

namespace json = pledge::schema::encoding::json;

client::client(std::string endpoint,
               transport_t transport,
               const uint32_t max_retries)
    : endpoint_{trim_endpoint(endpoint)},
      transport_{std::move(transport)},
      max_retries_{max_retries} {}

const std::string& client::endpoint() const {
  return endpoint_;
}

std::string make_broadcast_request(
    const pledge::schema::bytes_view_t& envelope_bytes) {
  auto document = Json::Value{Json::objectValue};
  document["jsonrpc"] = std::string{kJsonRpcVersion};
  document["id"] = pledge::common::make_uuid();
  document["method"] = std::string{kBroadcastTxCommit};
  document["params"]["tx"] = pledge::schema::to_base64(envelope_bytes);
  return json::write_canonical(document);
}

http_response client::exchange(const http_request& request) const {
  auto response = transport_(request);
  for (auto retry = uint32_t{0};
       retry < max_retries_ &&
       response.status == transport_status::connect_failed;
       ++retry) {
    spdlog::warn("Connection to {} failed ({}), retrying ({}/{})", request.url,
                 response.error, retry + 1, max_retries_);
    response = transport_(request);
  }
  return response;
}

pledge::schema::broadcast_result_t client::broadcast_tx_commit(
    const pledge::schema::bytes_view_t& envelope_bytes) const {
  auto request = http_request{.method = http_method::post,
                              .url = endpoint_,
                              .content_type = "application/json",
                              .body = make_broadcast_request(envelope_bytes)};
  spdlog::debug("broadcast_tx_commit request: {}", request.body);

  auto response = exchange(request);
  spdlog::debug("broadcast_tx_commit response (HTTP {}): {}",
                response.status_code, response.body);

  auto result = classify_broadcast(response);
  if (result.error) {
    spdlog::error("broadcast_tx_commit failed: {}",
                  pledge::schema::describe(*result.error));
  } else {
    spdlog::info("Transaction {} committed at height {}", result.hash,
                 result.height);
  }
  return result;
}

pledge::schema::query_response_t client::abci_query(
    const pledge::schema::query_request_t& request) const {
  auto http = http_request{.method = http_method::get,
                           .url = endpoint_ + std::string{kAbciQueryRoute}};
  http.query.emplace_back("path", pledge::query::quote_path(request.path));
  if (request.data) {
    http.query.emplace_back("data", pledge::schema::to_base64(*request.data));
  }
  if (request.height) {
    http.query.emplace_back("height", *request.height);
  }

  auto response = exchange(http);
  spdlog::debug("abci_query response (HTTP {}): {}", response.status_code,
                response.body);

  auto result = classify_query(response);
  if (result.error) {
    spdlog::error("abci_query {} failed: {}", request.path,
                  pledge::schema::describe(*result.error));
  }
  return result;
}

}  // namespace pledge::rpc
