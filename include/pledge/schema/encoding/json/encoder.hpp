#pragma once
#include <pledge/common/critical.hpp>
#include <pledge/schema/encoding/encoder.hpp>
#include <pledge/schema/encoding/json/beneficiary.hpp>
#include <pledge/schema/encoding/json/commiter.hpp>
#include <pledge/schema/encoding/json/commitment.hpp>
#include <pledge/schema/encoding/json/primitives.hpp>
#include <pledge/schema/encoding/json/promise.hpp>
#include <pledge/schema/encoding/json/promise_commitment.hpp>
#include <pledge/schema/encoding/json/transaction.hpp>
#include <pledge/schema/encoding/json/writer.hpp>
#include <json/json.h>
#include <iterator>

namespace pledge::schema::encoding {

struct json_encoder_tag {};

template <>
struct encoder<json_encoder_tag> final {
  template <typename T>
  pledge::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, pledge::schema::bytes_t& out);

  template <typename T>
  T decode(const pledge::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const pledge::schema::bytes_view_t& bytes);
};

template <typename T>
pledge::schema::bytes_t encoder<json_encoder_tag>::encode(const T& obj) {
  auto out = json::writer{};
  json::encode(obj, out);
  auto text = out.release();
  if (text.empty()) {
    pledge::common::critical("failed to encode JSON object");
  }
  return pledge::schema::make_bytes(text);
}

template <typename T>
void encoder<json_encoder_tag>::encode(const T& obj,
                                       pledge::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<json_encoder_tag>::decode(
    const pledge::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    pledge::common::critical("failed to decode {} JSON bytes", bytes.size());
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const pledge::schema::bytes_view_t& bytes) {
  auto document = json::parse(bytes);
  if (!document) {
    return std::nullopt;
  }
  auto value = T{};
  if (!json::decode(value, *document)) {
    return std::nullopt;
  }
  return value;
}

}  // namespace pledge::schema::encoding
