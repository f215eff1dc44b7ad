#pragma once
#include <pledge/schema/beneficiary.hpp>
#include <pledge/schema/encoding/json/writer.hpp>
#include <json/json.h>

namespace pledge::schema::encoding::json {

void encode(const beneficiary<1>& o, writer& out);
bool decode(beneficiary<1>& o, const Json::Value& in);

}  // namespace pledge::schema::encoding::json
