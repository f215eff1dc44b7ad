#pragma once

#include <pledge/rpc/transport.hpp>
#include <pledge/schema/broadcast_result.hpp>
#include <pledge/schema/query_result.hpp>

namespace pledge::rpc {

/// Classify a broadcast_tx_commit exchange. First match wins:
///   transport failure            -> timeout / transport
///   JSON-RPC `error` object      -> transport (even beside a result)
///   body is not JSON             -> transport if HTTP status is not 2xx,
///                                   otherwise empty_result
///   no `result` object           -> empty_result
///   check_tx.code != 0           -> validation_rejected
///   deliver_tx.code != 0         -> execution_rejected
/// CometBFT 0.38 names the second stage `tx_result`; it is read when
/// `deliver_tx` is absent.
pledge::schema::broadcast_result_t classify_broadcast(
    const http_response& response);

/// Same first four rules, then a missing `result.response` is empty_result
/// and `response.code != 0` is execution_rejected.
pledge::schema::query_response_t classify_query(const http_response& response);

}  // namespace pledge::rpc
