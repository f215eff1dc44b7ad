#pragma once
#include <pledge/schema/commitment.hpp>
#include <pledge/schema/promise.hpp>
#include <optional>

// Schema type: promise + commitment.
// Composite body signed and submitted as one unit so the ledger accepts both
// records or neither. Both members are optional on the wire (null when
// absent) but a sealed composite always carries both.
namespace pledge::schema {

template <uint16_t Version>
struct promise_commitment;

template <>
struct promise_commitment<1> final {
  std::optional<promise_t> promise;
  std::optional<commitment_t> commitment;
};

using promise_commitment_t = promise_commitment<1>;

}  // namespace pledge::schema
