#pragma once

#include <pledge/schema/commiter.hpp>
#include <pledge/schema/primitives.hpp>
#include <string>
#include <string_view>

namespace pledge::keys {

inline constexpr auto kCommiterIdPrefix = std::string_view{"commiter:"};

/// "commiter:" + base64(public key). Same key, same id, in any process.
std::string make_commiter_id(
    const pledge::schema::ed25519_public_key_t& public_key);

/// Registration body for the identity owning `public_key`.
pledge::schema::commiter_t make_commiter(
    const pledge::schema::ed25519_public_key_t& public_key,
    std::string name);

}  // namespace pledge::keys
