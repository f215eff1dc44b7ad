#pragma once
#include <pledge/schema/beneficiary.hpp>
#include <pledge/schema/commiter.hpp>
#include <pledge/schema/commitment.hpp>
#include <pledge/schema/primitives.hpp>
#include <pledge/schema/promise.hpp>
#include <pledge/schema/promise_commitment.hpp>
#include <variant>

namespace pledge::schema {

using transaction_body_t = std::variant<commiter_t,
                                        beneficiary_t,
                                        promise_t,
                                        commitment_t,
                                        promise_commitment_t>;

template <uint16_t Version>
struct signed_transaction;

/// Envelope as transmitted: {"body": ..., "signature": base64}.
template <>
struct signed_transaction<1> final {
  transaction_body_t body{};
  ed25519_signature_t signature{};
};

using signed_transaction_t = signed_transaction<1>;

}  // namespace pledge::schema
