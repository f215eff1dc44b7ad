#pragma once

#include <pledge/rpc/transport.hpp>
#include <pledge/schema/broadcast_result.hpp>
#include <pledge/schema/primitives.hpp>
#include <pledge/schema/query_request.hpp>
#include <pledge/schema/query_result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace pledge::rpc {

inline constexpr auto kJsonRpcVersion = std::string_view{"2.0"};
inline constexpr auto kBroadcastTxCommit =
    std::string_view{"broadcast_tx_commit"};
inline constexpr auto kAbciQueryRoute = std::string_view{"/abci_query"};

/// JSON-RPC client for one CometBFT node.
///
/// Each call performs one HTTP exchange, plus `max_retries` more when no
/// connection could be made. An exchange that broke off after connecting may
/// already have reached the node, so it is never resent; neither are HTTP
/// responses, including error statuses, or timeouts.
class client final {
 public:
  client(std::string endpoint, transport_t transport, uint32_t max_retries);

  /// POST {"id","jsonrpc","method":"broadcast_tx_commit","params":{"tx"}}.
  pledge::schema::broadcast_result_t broadcast_tx_commit(
      const pledge::schema::bytes_view_t& envelope_bytes) const;

  /// GET <endpoint>/abci_query?path="<path>"[&data=<base64>][&height=<h>].
  pledge::schema::query_response_t abci_query(
      const pledge::schema::query_request_t& request) const;

  const std::string& endpoint() const;

 private:
  http_response exchange(const http_request& request) const;

  std::string endpoint_;
  transport_t transport_;
  uint32_t max_retries_{};
};

/// Request body for broadcast_tx_commit with a fresh UUID id.
std::string make_broadcast_request(
    const pledge::schema::bytes_view_t& envelope_bytes);

}  // namespace pledge::rpc
