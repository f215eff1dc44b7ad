#pragma once

#include <pledge/schema/client_error.hpp>
#include <pledge/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: broadcast result.
// Outcome of broadcast_tx_commit: the two ABCI stages the ledger reports, or
// the classified error that stopped the submission.
namespace pledge::schema {

struct tx_stage_result final {
  uint32_t code{};
  std::string log;
  std::string codespace;
};

template <uint16_t Version>
struct broadcast_result;

template <>
struct broadcast_result<1> final {
  uint16_t version{1};
  std::optional<client_error_t> error;
  tx_stage_result check_tx;
  tx_stage_result deliver_tx;
  std::string hash;
  int64_t height{};
};

using broadcast_result_t = broadcast_result<1>;

}  // namespace pledge::schema
