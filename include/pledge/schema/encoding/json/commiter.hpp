#pragma once
#include <pledge/schema/commiter.hpp>
#include <pledge/schema/encoding/json/writer.hpp>
#include <json/json.h>

namespace pledge::schema::encoding::json {

void encode(const commiter<1>& o, writer& out);
bool decode(commiter<1>& o, const Json::Value& in);

}  // namespace pledge::schema::encoding::json
