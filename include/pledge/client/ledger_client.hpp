#pragma once

#include <pledge/envelope/envelope.hpp>
#include <pledge/keys/key_manager.hpp>
#include <pledge/rpc/client.hpp>
#include <pledge/schema/broadcast_result.hpp>
#include <pledge/schema/client_error.hpp>
#include <pledge/schema/query_result.hpp>

#include <optional>
#include <string>

namespace pledge::client {

struct promise_arguments final {
  std::string text;
  std::string due;  // YYYY-MM-DD or RFC 3339
  std::string beneficiary_id;
  std::string parent_promise_id;  // empty for a root promise
  std::string commitment_due;
};

struct query_arguments final {
  std::string path;   // wins over alias when non-empty
  std::string alias;  // promise, commitment, commiter or beneficiary
  std::optional<std::string> data;
  std::optional<std::string> height;
};

struct submit_result final {
  std::optional<pledge::schema::client_error_t> error;
  std::string id;  // id of the created record (the promise for a composite)
  std::optional<pledge::envelope::sealed_envelope> envelope;
  pledge::schema::broadcast_result_t broadcast;
};

struct identity_result final {
  std::optional<pledge::schema::client_error_t> error;
  std::string id;
  std::string public_key;  // base64
};

/// High-level ledger operations: each one loads the local identity, builds
/// and seals a body and submits it through broadcast_tx_commit.
class ledger_client final {
 public:
  ledger_client(pledge::keys::key_manager keys, pledge::rpc::client rpc);

  /// Register the local identity under `name`. Its id is derived from the
  /// public key, so repeating the call names the same identity.
  submit_result register_commiter(std::string name) const;

  /// New beneficiary with a fresh "beneficiary:<uuid>" id.
  submit_result create_beneficiary(std::string name) const;

  /// Promise and commitment signed and submitted as one composite envelope.
  submit_result create_promise_with_commitment(
      const promise_arguments& arguments) const;

  pledge::schema::query_response_t get(const query_arguments& arguments) const;

  identity_result identity() const;

 private:
  submit_result submit(pledge::schema::transaction_body_t body,
                       const pledge::crypto::keypair& pair,
                       std::string id) const;

  pledge::keys::key_manager keys_;
  pledge::rpc::client rpc_;
};

}  // namespace pledge::client
