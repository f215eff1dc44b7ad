#pragma once

#include <pledge/crypto/ed25519.hpp>
#include <pledge/schema/client_error.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace pledge::keys {

inline constexpr auto kPrivateKeyFileName = std::string_view{"ed25519.key"};
inline constexpr auto kPublicKeyFileName = std::string_view{"ed25519.pub"};

struct load_result final {
  std::optional<pledge::crypto::keypair> keypair;
  std::optional<pledge::schema::client_error_t> error;
  bool generated{};  // true when this call created the key material
};

/// Owns the signing keypair persisted under one directory.
///
/// The private file holds the 32-byte seed followed by the 32-byte public key
/// (a bare 32-byte seed is also accepted on load) and is written owner-only.
/// The public file holds the 32 raw public key bytes.
class key_manager final {
 public:
  explicit key_manager(std::filesystem::path key_directory);

  /// Load the persisted pair, or generate and persist one on first use.
  ///
  /// Any filesystem failure is a key_io error. A freshly generated key that
  /// could not be written is never returned.
  load_result ensure_keypair() const;

  const std::filesystem::path& key_directory() const;
  std::filesystem::path private_key_path() const;
  std::filesystem::path public_key_path() const;

 private:
  load_result load() const;
  load_result generate() const;

  std::filesystem::path key_directory_;
};

}  // namespace pledge::keys
