#pragma once

#include <pledge/schema/primitives.hpp>
#include <optional>

namespace pledge::crypto {

struct keypair final {
  pledge::schema::ed25519_seed_t seed{};  // private half
  pledge::schema::ed25519_public_key_t public_key{};
};

/// True when the linked OpenSSL exposes Ed25519.
bool available();

/// Fresh keypair from OpenSSL's CSPRNG.
std::optional<keypair> generate_keypair();

std::optional<pledge::schema::ed25519_public_key_t> derive_public_key(
    const pledge::schema::ed25519_seed_t& seed);

std::optional<pledge::schema::ed25519_signature_t> sign(
    const pledge::schema::bytes_view_t& message,
    const pledge::schema::ed25519_seed_t& seed);

bool verify(const pledge::schema::bytes_view_t& message,
            const pledge::schema::ed25519_public_key_t& public_key,
            const pledge::schema::ed25519_signature_t& signature);

}  // namespace pledge::crypto
