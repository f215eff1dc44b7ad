#include <pledge/schema/encoding/json/commitment.hpp>
#include <pledge/schema/encoding/json/promise.hpp>
#include <pledge/schema/encoding/json/promise_commitment.hpp>

using namespace pledge::schema;

namespace pledge::schema::encoding::json {

namespace {

template <typename T>
void encode_nullable(const std::optional<T>& o, writer& out) {
  if (!o) {
    out.null();
    return;
  }
  encode(*o, out);
}

template <typename T>
bool decode_nullable(std::optional<T>& o, const Json::Value& in) {
  if (in.isNull()) {
    o.reset();
    return true;
  }
  auto value = T{};
  if (!decode(value, in)) {
    return false;
  }
  o = std::move(value);
  return true;
}

}  // namespace

void encode(const promise_commitment<1>& o, writer& out) {
  out.begin_object();
  encode_nullable(o.promise, out.key("promise"));
  encode_nullable(o.commitment, out.key("commitment"));
  out.end_object();
}

bool decode(promise_commitment<1>& o, const Json::Value& in) {
  if (!in.isObject() || !in.isMember("promise") ||
      !in.isMember("commitment")) {
    return false;
  }
  return decode_nullable(o.promise, in["promise"]) &&
         decode_nullable(o.commitment, in["commitment"]);
}

}  // namespace pledge::schema::encoding::json
