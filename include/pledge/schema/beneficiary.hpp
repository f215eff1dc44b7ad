#pragma once
#include <pledge/schema/body_type.hpp>
#include <pledge/schema/primitives.hpp>
#include <string>

// Schema type: beneficiary.
// Party a promise is made to. Not tied to any keypair.
namespace pledge::schema {

template <uint16_t Version>
struct beneficiary;

template <>
struct beneficiary<1> final {
  static constexpr auto kType = body_type::beneficiary;
  std::string id;
  std::string name;
};

using beneficiary_t = beneficiary<1>;

}  // namespace pledge::schema
