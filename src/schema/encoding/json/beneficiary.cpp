#include <pledge/schema/encoding/json/beneficiary.hpp>
#include <pledge/schema/encoding/json/primitives.hpp>

using namespace pledge::schema;

namespace pledge::schema::encoding::json {

void encode(const beneficiary<1>& o, writer& out) {
  out.begin_object();
  encode(beneficiary<1>::kType, out.key("type"));
  out.key("id").string(o.id);
  out.key("name").string(o.name);
  out.end_object();
}

bool decode(beneficiary<1>& o, const Json::Value& in) {
  if (!in.isObject()) {
    return false;
  }
  auto type = body_type{};
  if (!decode(type, in["type"]) || type != beneficiary<1>::kType) {
    return false;
  }
  auto id = read_string(in, "id");
  auto name = read_string(in, "name");
  if (!id || !name) {
    return false;
  }
  o.id = *id;
  o.name = *name;
  return true;
}

}  // namespace pledge::schema::encoding::json
