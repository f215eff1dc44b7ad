#pragma once

#include <pledge/schema/error_code.hpp>
#include <pledge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Schema type: client error.
// Classified failure returned by every client operation. Remote fields are
// populated only when the ledger or its RPC layer supplied them.
namespace pledge::schema {

template <uint16_t Version>
struct client_error;

template <>
struct client_error<1> final {
  uint16_t version{1};
  error_code code{error_code::transport};
  std::string message;
  std::optional<int64_t> remote_code;  // JSON-RPC error code or ABCI code
  std::string remote_data;             // JSON-RPC error data
  std::string log;                     // check_tx / deliver_tx / query log
};

using client_error_t = client_error<1>;

inline constexpr auto kErrorCodeNames =
    std::array<std::pair<std::string_view, error_code>, 10>{{
        {"KeyIOError", error_code::key_io},
        {"EncodingError", error_code::encoding},
        {"TransportError", error_code::transport},
        {"EmptyResultError", error_code::empty_result},
        {"ValidationRejected", error_code::validation_rejected},
        {"ExecutionRejected", error_code::execution_rejected},
        {"DecodeError", error_code::decode},
        {"Timeout", error_code::timeout},
        {"InvalidArgument", error_code::invalid_argument},
        {"SignatureInvalid", error_code::signature_invalid},
    }};

client_error_t make_error(error_code code, std::string message);

std::string_view error_name(error_code code);

/// One-line rendering used by the CLI: "<Kind>: <message>".
std::string describe(const client_error_t& error);

}  // namespace pledge::schema
