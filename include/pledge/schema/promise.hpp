#pragma once
#include <pledge/schema/body_type.hpp>
#include <pledge/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: promise.
// Free-text undertaking towards a beneficiary, optionally nested under a
// parent promise. Parent links form a forest; cycles are not checked here.
namespace pledge::schema {

template <uint16_t Version>
struct promise;

template <>
struct promise<1> final {
  static constexpr auto kType = body_type::promise;
  std::string id;
  std::string text;
  timestamp_seconds_t due{};
  std::string beneficiary_id;
  std::optional<std::string> parent_promise_id;  // encoded as null if absent
};

using promise_t = promise<1>;

}  // namespace pledge::schema
