#include <pledge/schema/encoding/json/commiter.hpp>
#include <pledge/schema/encoding/json/primitives.hpp>

using namespace pledge::schema;

namespace pledge::schema::encoding::json {

void encode(const commiter<1>& o, writer& out) {
  out.begin_object();
  encode(commiter<1>::kType, out.key("type"));
  out.key("id").string(o.id);
  out.key("name").string(o.name);
  out.key("commiter_pubkey").string(o.commiter_pubkey);
  out.end_object();
}

bool decode(commiter<1>& o, const Json::Value& in) {
  if (!in.isObject()) {
    return false;
  }
  auto type = body_type{};
  if (!decode(type, in["type"]) || type != commiter<1>::kType) {
    return false;
  }
  auto id = read_string(in, "id");
  auto name = read_string(in, "name");
  auto pubkey = read_string(in, "commiter_pubkey");
  if (!id || !name || !pubkey) {
    return false;
  }
  o.id = *id;
  o.name = *name;
  o.commiter_pubkey = *pubkey;
  return true;
}

}  // namespace pledge::schema::encoding::json
