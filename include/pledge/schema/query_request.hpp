#pragma once

#include <pledge/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: query request.
// A resolved abci_query call. `height` is an opaque version selector passed
// through to the ledger as given.
namespace pledge::schema {

template <uint16_t Version>
struct query_request;

template <>
struct query_request<1> final {
  std::string path;
  std::optional<bytes_t> data;
  std::optional<std::string> height;
};

using query_request_t = query_request<1>;

}  // namespace pledge::schema
