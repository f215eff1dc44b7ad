#include <pledge/schema/encoding/json/beneficiary.hpp>
#include <pledge/schema/encoding/json/commiter.hpp>
#include <pledge/schema/encoding/json/commitment.hpp>
#include <pledge/schema/encoding/json/primitives.hpp>
#include <pledge/schema/encoding/json/promise.hpp>
#include <pledge/schema/encoding/json/promise_commitment.hpp>
#include <pledge/schema/encoding/json/transaction.hpp>

#include <algorithm>

using namespace pledge::schema;

namespace pledge::schema::encoding::json {

namespace {

template <typename T>
bool decode_as(transaction_body_t& o, const Json::Value& in) {
  auto value = T{};
  if (!decode(value, in)) {
    return false;
  }
  o = std::move(value);
  return true;
}

}  // namespace

void encode(const transaction_body_t& o, writer& out) {
  std::visit([&](const auto& body) { encode(body, out); }, o);
}

bool decode(transaction_body_t& o, const Json::Value& in) {
  if (!in.isObject()) {
    return false;
  }
  // Single bodies carry a discriminator; the composite is recognised by its
  // two named members.
  if (!in.isMember("type")) {
    return decode_as<promise_commitment_t>(o, in);
  }
  auto type = body_type{};
  if (!decode(type, in["type"])) {
    return false;
  }
  switch (type) {
    case body_type::commiter:
      return decode_as<commiter_t>(o, in);
    case body_type::beneficiary:
      return decode_as<beneficiary_t>(o, in);
    case body_type::promise:
      return decode_as<promise_t>(o, in);
    case body_type::commitment:
      return decode_as<commitment_t>(o, in);
  }
  return false;
}

void encode(const signed_transaction<1>& o, writer& out) {
  out.begin_object();
  encode(o.body, out.key("body"));
  out.key("signature").string(
      to_base64(bytes_view_t{o.signature.data(), o.signature.size()}));
  out.end_object();
}

bool decode(signed_transaction<1>& o, const Json::Value& in) {
  if (!in.isObject() || !in.isMember("body")) {
    return false;
  }
  auto signature = read_string(in, "signature");
  if (!signature) {
    return false;
  }
  auto raw = try_from_base64(*signature);
  if (!raw || raw->size() != o.signature.size()) {
    return false;
  }
  if (!decode(o.body, in["body"])) {
    return false;
  }
  std::copy(std::begin(*raw), std::end(*raw), std::begin(o.signature));
  return true;
}

}  // namespace pledge::schema::encoding::json
