#include <pledge/crypto/ed25519.hpp>

#include <openssl/evp.h>

#include <memory>

namespace pledge::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx) {
    return false;
  }
  return true;
}

evp_pkey_ptr make_private_key(const pledge::schema::ed25519_seed_t& seed) {
  return evp_pkey_ptr{EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                   seed.data(), seed.size()),
                      EVP_PKEY_free};
}

std::optional<pledge::schema::ed25519_public_key_t> raw_public_key(
    EVP_PKEY* pkey) {
  auto public_key = pledge::schema::ed25519_public_key_t{};
  auto length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey, public_key.data(), &length) != 1 ||
      length != public_key.size()) {
    return std::nullopt;
  }
  return public_key;
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519();
  return available_now;
}

std::optional<keypair> generate_keypair() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    return std::nullopt;
  }

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &raw_pkey) != 1) {
    return std::nullopt;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};

  auto out = keypair{};
  auto seed_length = out.seed.size();
  if (EVP_PKEY_get_raw_private_key(pkey.get(), out.seed.data(),
                                   &seed_length) != 1 ||
      seed_length != out.seed.size()) {
    return std::nullopt;
  }
  auto public_key = raw_public_key(pkey.get());
  if (!public_key) {
    return std::nullopt;
  }
  out.public_key = *public_key;
  return out;
}

std::optional<pledge::schema::ed25519_public_key_t> derive_public_key(
    const pledge::schema::ed25519_seed_t& seed) {
  auto pkey = make_private_key(seed);
  if (!pkey) {
    return std::nullopt;
  }
  return raw_public_key(pkey.get());
}

std::optional<pledge::schema::ed25519_signature_t> sign(
    const pledge::schema::bytes_view_t& message,
    const pledge::schema::ed25519_seed_t& seed) {
  auto pkey = make_private_key(seed);
  if (!pkey) {
    return std::nullopt;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  // Ed25519 is one-shot: no digest, the whole message goes to DigestSign.
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return std::nullopt;
  }

  auto signature = pledge::schema::ed25519_signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

bool verify(const pledge::schema::bytes_view_t& message,
            const pledge::schema::ed25519_public_key_t& public_key,
            const pledge::schema::ed25519_signature_t& signature) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                  public_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

}  // namespace pledge::crypto
