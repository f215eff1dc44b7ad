#pragma once
#include <pledge/schema/transaction.hpp>
#include <pledge/schema/encoding/json/writer.hpp>
#include <json/json.h>

namespace pledge::schema::encoding::json {

void encode(const transaction_body_t& o, writer& out);
bool decode(transaction_body_t& o, const Json::Value& in);

void encode(const signed_transaction<1>& o, writer& out);
bool decode(signed_transaction<1>& o, const Json::Value& in);

}  // namespace pledge::schema::encoding::json
