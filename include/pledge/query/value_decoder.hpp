#pragma once

#include <pledge/schema/client_error.hpp>
#include <pledge/schema/query_view.hpp>

#include <optional>
#include <string_view>

namespace pledge::query {

struct decode_result final {
  std::optional<pledge::schema::query_view_t> view;
  std::optional<pledge::schema::client_error_t> error;
};

/// Turn a base64 query value into something printable.
///
/// Empty input yields an empty view. Bytes that parse as JSON become a
/// pretty-printed JSON view; bytes holding a NUL are shown as base64; anything
/// else is text. Invalid base64 is a decode error.
decode_result decode_value(std::string_view value_b64);

}  // namespace pledge::query
