#include <pledge/schema/encoding/json/commitment.hpp>
#include <pledge/schema/encoding/json/primitives.hpp>

using namespace pledge::schema;

namespace pledge::schema::encoding::json {

void encode(const commitment<1>& o, writer& out) {
  out.begin_object();
  encode(commitment<1>::kType, out.key("type"));
  out.key("id").string(o.id);
  out.key("promise_id").string(o.promise_id);
  out.key("commiter_id").string(o.commiter_id);
  out.key("due").integer(o.due);
  out.end_object();
}

bool decode(commitment<1>& o, const Json::Value& in) {
  if (!in.isObject()) {
    return false;
  }
  auto type = body_type{};
  if (!decode(type, in["type"]) || type != commitment<1>::kType) {
    return false;
  }
  auto id = read_string(in, "id");
  auto promise_id = read_string(in, "promise_id");
  auto commiter_id = read_string(in, "commiter_id");
  auto due = read_int64(in, "due");
  if (!id || !promise_id || !commiter_id || !due) {
    return false;
  }
  o.id = *id;
  o.promise_id = *promise_id;
  o.commiter_id = *commiter_id;
  o.due = *due;
  return true;
}

}  // namespace pledge::schema::encoding::json
