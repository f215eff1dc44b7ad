#pragma once

#include <pledge/crypto/ed25519.hpp>
#include <pledge/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace pledge::testing {

inline std::filesystem::path make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         (std::string{prefix} + "_" +
          std::to_string(static_cast<unsigned long long>(now)));
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Removes its directory when the test ends.
struct temp_directory final {
  explicit temp_directory(const std::string_view prefix)
      : path{make_temp_path(prefix)} {}
  ~temp_directory() { remove_path(path); }
  temp_directory(const temp_directory&) = delete;
  temp_directory& operator=(const temp_directory&) = delete;

  std::filesystem::path path;
};

/// Lowercase or uppercase hex without prefix; nullopt on odd length or a
/// non-hex digit.
inline std::optional<pledge::schema::bytes_t> try_from_hex(
    const std::string_view hex) {
  auto nibble = [](const char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
      return c - 'A' + 10;
    }
    return -1;
  };
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  auto out = pledge::schema::bytes_t{};
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    auto high = nibble(hex[i]);
    auto low = nibble(hex[i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return out;
}

inline pledge::schema::ed25519_seed_t make_seed(const uint8_t seed) {
  auto out = pledge::schema::ed25519_seed_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Deterministic keypair derived from a fixed seed pattern.
inline pledge::crypto::keypair make_keypair(const uint8_t seed) {
  auto pair = pledge::crypto::keypair{.seed = make_seed(seed)};
  if (auto public_key = pledge::crypto::derive_public_key(pair.seed)) {
    pair.public_key = *public_key;
  }
  return pair;
}

}  // namespace pledge::testing
