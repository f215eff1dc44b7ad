#pragma once
#include <pledge/schema/promise_commitment.hpp>
#include <pledge/schema/encoding/json/writer.hpp>
#include <json/json.h>

namespace pledge::schema::encoding::json {

void encode(const promise_commitment<1>& o, writer& out);
bool decode(promise_commitment<1>& o, const Json::Value& in);

}  // namespace pledge::schema::encoding::json
