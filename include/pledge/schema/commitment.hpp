#pragma once
#include <pledge/schema/body_type.hpp>
#include <pledge/schema/primitives.hpp>
#include <string>

// Schema type: commitment.
// A commiter taking on exactly one promise, with its own due time.
namespace pledge::schema {

template <uint16_t Version>
struct commitment;

template <>
struct commitment<1> final {
  static constexpr auto kType = body_type::commitment;
  std::string id;
  std::string promise_id;
  std::string commiter_id;
  timestamp_seconds_t due{};
};

using commitment_t = commitment<1>;

}  // namespace pledge::schema
