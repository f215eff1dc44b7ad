#pragma once

#include <pledge/schema/client_error.hpp>
#include <pledge/schema/primitives.hpp>
#include <pledge/schema/transaction.hpp>

#include <optional>

namespace pledge::envelope {

struct sealed_envelope final {
  pledge::schema::bytes_t body_bytes;  // exactly the signed bytes
  pledge::schema::ed25519_signature_t signature{};
  pledge::schema::bytes_t envelope_bytes;  // what goes on the wire
};

struct seal_result final {
  std::optional<sealed_envelope> envelope;
  std::optional<pledge::schema::client_error_t> error;
};

struct open_result final {
  std::optional<pledge::schema::signed_transaction_t> transaction;
  pledge::schema::bytes_t body_bytes;
  std::optional<pledge::schema::client_error_t> error;
};

struct composite_result final {
  std::optional<pledge::schema::promise_commitment_t> body;
  std::optional<pledge::schema::client_error_t> error;
};

/// Canonically encode `body`, sign those bytes and splice them unchanged into
/// `{"body":<body>,"signature":"<base64>"}`.
///
/// A composite missing either member, or whose commitment does not reference
/// its promise, is an encoding error.
seal_result seal(const pledge::schema::transaction_body_t& body,
                 const pledge::schema::ed25519_seed_t& seed);

/// Parse an envelope and verify its signature over the canonical body bytes.
/// Malformed input is an encoding error; a bad signature is signature_invalid.
open_result open(const pledge::schema::bytes_view_t& envelope_bytes,
                 const pledge::schema::ed25519_public_key_t& public_key);

composite_result make_promise_commitment(
    std::optional<pledge::schema::promise_t> promise,
    std::optional<pledge::schema::commitment_t> commitment);

}  // namespace pledge::envelope
