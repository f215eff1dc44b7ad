#pragma once
#include <pledge/schema/body_type.hpp>
#include <pledge/schema/primitives.hpp>
#include <string>

// Schema type: commiter.
// Identity registration: binds a display name to the signing public key. The
// id is derived from the key, so re-registering from the same keypair always
// names the same identity.
namespace pledge::schema {

template <uint16_t Version>
struct commiter;

template <>
struct commiter<1> final {
  static constexpr auto kType = body_type::commiter;
  std::string id;               // "commiter:" + base64(public key)
  std::string name;
  std::string commiter_pubkey;  // base64(public key)
};

using commiter_t = commiter<1>;

}  // namespace pledge::schema
