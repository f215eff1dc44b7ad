#include <pledge/crypto/ed25519.hpp>
#include <pledge/envelope/envelope.hpp>
#include <pledge/schema/encoding/json/encoder.hpp>

#include <spdlog/spdlog.h>

#include <iterator>
#include <string_view>

namespace pledge::envelope {

namespace {

using encoder_t = pledge::schema::encoding::encoder<
    pledge::schema::encoding::json_encoder_tag>;
using pledge::schema::client_error_t;
using pledge::schema::error_code;
using pledge::schema::make_error;

constexpr auto kEnvelopePrefix = std::string_view{"{\"body\":"};
constexpr auto kSignaturePrefix = std::string_view{",\"signature\":\""};
constexpr auto kEnvelopeSuffix = std::string_view{"\"}"};

std::optional<client_error_t> check_composite(
    const pledge::schema::promise_commitment_t& body) {
  if (!body.promise) {
    return make_error(error_code::encoding, "composite body has no promise");
  }
  if (!body.commitment) {
    return make_error(error_code::encoding,
                      "composite body has no commitment");
  }
  if (body.commitment->promise_id != body.promise->id) {
    return make_error(error_code::encoding,
                      "commitment promise_id '" + body.commitment->promise_id +
                          "' does not match promise id '" + body.promise->id +
                          "'");
  }
  return std::nullopt;
}

void append(pledge::schema::bytes_t& out, const std::string_view text) {
  out.insert(std::end(out), std::begin(text), std::end(text));
}

}  // namespace

seal_result seal(const pledge::schema::transaction_body_t& body,
                 const pledge::schema::ed25519_seed_t& seed) {
  if (const auto* composite =
          std::get_if<pledge::schema::promise_commitment_t>(&body)) {
    if (auto error = check_composite(*composite)) {
      spdlog::error("Refusing to seal: {}", error->message);
      return seal_result{.error = std::move(error)};
    }
  }

  auto encoder = encoder_t{};
  auto sealed = sealed_envelope{};
  sealed.body_bytes = encoder.encode(body);

  auto signature = pledge::crypto::sign(sealed.body_bytes, seed);
  if (!signature) {
    return seal_result{
        .error = make_error(error_code::encoding, "ed25519 signing failed")};
  }
  sealed.signature = *signature;

  auto signature_b64 = pledge::schema::to_base64(pledge::schema::bytes_view_t{
      sealed.signature.data(), sealed.signature.size()});
  sealed.envelope_bytes.reserve(kEnvelopePrefix.size() +
                                sealed.body_bytes.size() +
                                kSignaturePrefix.size() + signature_b64.size() +
                                kEnvelopeSuffix.size());
  append(sealed.envelope_bytes, kEnvelopePrefix);
  sealed.envelope_bytes.insert(std::end(sealed.envelope_bytes),
                               std::begin(sealed.body_bytes),
                               std::end(sealed.body_bytes));
  append(sealed.envelope_bytes, kSignaturePrefix);
  append(sealed.envelope_bytes, signature_b64);
  append(sealed.envelope_bytes, kEnvelopeSuffix);

  spdlog::debug("Sealed envelope: {} body bytes, {} envelope bytes",
                sealed.body_bytes.size(), sealed.envelope_bytes.size());
  return seal_result{.envelope = std::move(sealed)};
}

open_result open(const pledge::schema::bytes_view_t& envelope_bytes,
                 const pledge::schema::ed25519_public_key_t& public_key) {
  auto encoder = encoder_t{};
  auto transaction =
      encoder.try_decode<pledge::schema::signed_transaction_t>(envelope_bytes);
  if (!transaction) {
    return open_result{
        .error = make_error(error_code::encoding, "malformed envelope")};
  }
  if (const auto* composite = std::get_if<pledge::schema::promise_commitment_t>(
          &transaction->body)) {
    if (auto error = check_composite(*composite)) {
      return open_result{.error = std::move(error)};
    }
  }

  auto result = open_result{};
  result.body_bytes = encoder.encode(transaction->body);
  if (!pledge::crypto::verify(result.body_bytes, public_key,
                              transaction->signature)) {
    result.error = make_error(error_code::signature_invalid,
                              "envelope signature does not verify");
    return result;
  }
  result.transaction = std::move(transaction);
  return result;
}

composite_result make_promise_commitment(
    std::optional<pledge::schema::promise_t> promise,
    std::optional<pledge::schema::commitment_t> commitment) {
  auto body = pledge::schema::promise_commitment_t{
      .promise = std::move(promise), .commitment = std::move(commitment)};
  if (auto error = check_composite(body)) {
    return composite_result{.error = std::move(error)};
  }
  return composite_result{.body = std::move(body)};
}

}  // namespace pledge::envelope
