#pragma once

#include <pledge/schema/client_error.hpp>
#include <pledge/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: query result.
// Read API envelope: the ABCI query response as returned by abci_query.
// `value` and `key` are kept in their base64 wire form; decoding them is the
// caller's decision.
namespace pledge::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  int64_t index{};
  std::string key;
  std::string value;
  std::string proof_ops;  // compact JSON, "null" when absent
  int64_t height{};
  std::string codespace;
};

using query_result_t = query_result<1>;

template <uint16_t Version>
struct query_response;

template <>
struct query_response<1> final {
  uint16_t version{1};
  std::optional<client_error_t> error;
  query_result_t result;
  std::string raw_body;  // JSON-RPC response exactly as received
};

using query_response_t = query_response<1>;

}  // namespace pledge::schema
