#include <pledge/schema/encoding/json/primitives.hpp>
#include <pledge/schema/encoding/json/promise.hpp>

using namespace pledge::schema;

namespace pledge::schema::encoding::json {

void encode(const promise<1>& o, writer& out) {
  out.begin_object();
  encode(promise<1>::kType, out.key("type"));
  out.key("id").string(o.id);
  out.key("text").string(o.text);
  out.key("due").integer(o.due);
  out.key("beneficiary_id").string(o.beneficiary_id);
  encode(o.parent_promise_id, out.key("parent_promise_id"));
  out.end_object();
}

bool decode(promise<1>& o, const Json::Value& in) {
  if (!in.isObject()) {
    return false;
  }
  auto type = body_type{};
  if (!decode(type, in["type"]) || type != promise<1>::kType) {
    return false;
  }
  auto id = read_string(in, "id");
  auto text = read_string(in, "text");
  auto due = read_int64(in, "due");
  auto beneficiary_id = read_string(in, "beneficiary_id");
  auto parent = read_nullable_string(in, "parent_promise_id");
  if (!id || !text || !due || !beneficiary_id || !parent) {
    return false;
  }
  o.id = *id;
  o.text = *text;
  o.due = *due;
  o.beneficiary_id = *beneficiary_id;
  o.parent_promise_id = *parent;
  return true;
}

}  // namespace pledge::schema::encoding::json
