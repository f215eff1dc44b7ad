#include <gtest/gtest.h>
#include <pledge/rpc/classifier.hpp>
#include <pledge/testing/scripted_transport.hpp>

using pledge::schema::error_code;
using pledge::testing::make_broadcast_body;
using pledge::testing::make_http_response;
using pledge::testing::make_query_body;

TEST(rpc_classifier, success_requires_both_stages_to_pass) {
  auto result = pledge::rpc::classify_broadcast(
      make_http_response(make_broadcast_body(0, "", 0, "")));
  EXPECT_FALSE(result.error.has_value());
  EXPECT_EQ(result.hash, "ABCD");
  EXPECT_EQ(result.height, 42);
}

TEST(rpc_classifier, rpc_error_wins_over_well_formed_result) {
  auto body = std::string{
      R"({"jsonrpc":"2.0","id":"1","error":{"code":-32603,)"
      R"("message":"Internal error","data":"tx already exists in cache"},)"
      R"("result":{"check_tx":{"code":0},"deliver_tx":{"code":0}}})"};
  auto result = pledge::rpc::classify_broadcast(make_http_response(body));
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, error_code::transport);
  EXPECT_EQ(result.error->remote_code, -32603);
  EXPECT_EQ(result.error->remote_data, "tx already exists in cache");
  EXPECT_EQ(result.error->message,
            "RPC error: -32603 Internal error (tx already exists in cache)");
}

TEST(rpc_classifier, check_tx_rejection_is_validation_even_if_deliver_passed) {
  auto result = pledge::rpc::classify_broadcast(
      make_http_response(make_broadcast_body(5, "bad signature", 0, "")));
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, error_code::validation_rejected);
  EXPECT_EQ(result.error->log, "bad signature");
  EXPECT_EQ(result.error->remote_code, 5);
  EXPECT_EQ(result.error->message, "CheckTx failed: bad signature");

  auto both = pledge::rpc::classify_broadcast(
      make_http_response(make_broadcast_body(5, "first", 7, "second")));
  ASSERT_TRUE(both.error.has_value());
  EXPECT_EQ(both.error->code, error_code::validation_rejected);
}

TEST(rpc_classifier, deliver_tx_rejection_is_execution) {
  auto result = pledge::rpc::classify_broadcast(
      make_http_response(make_broadcast_body(0, "", 3, "unknown beneficiary")));
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, error_code::execution_rejected);
  EXPECT_EQ(result.error->log, "unknown beneficiary");
  EXPECT_EQ(result.deliver_tx.code, 3u);
}

TEST(rpc_classifier, tx_result_is_read_when_deliver_tx_is_absent) {
  auto body = std::string{
      R"({"jsonrpc":"2.0","id":"1","result":{"check_tx":{"code":0,"log":""},)"
      R"("tx_result":{"code":9,"log":"duplicate id"},"hash":"FF","height":"3"}})"};
  auto result = pledge::rpc::classify_broadcast(make_http_response(body));
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, error_code::execution_rejected);
  EXPECT_EQ(result.error->log, "duplicate id");
}

TEST(rpc_classifier, missing_result_is_empty_result) {
  auto result = pledge::rpc::classify_broadcast(
      make_http_response(R"({"jsonrpc":"2.0","id":"1"})"));
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, error_code::empty_result);

  auto null_result = pledge::rpc::classify_broadcast(
      make_http_response(R"({"jsonrpc":"2.0","id":"1","result":null})"));
  ASSERT_TRUE(null_result.error.has_value());
  EXPECT_EQ(null_result.error->code, error_code::empty_result);
}

TEST(rpc_classifier, unparseable_body_depends_on_http_status) {
  auto bad_gateway = pledge::rpc::classify_broadcast(
      make_http_response("<html>Bad Gateway</html>", 502));
  ASSERT_TRUE(bad_gateway.error.has_value());
  EXPECT_EQ(bad_gateway.error->code, error_code::transport);
  EXPECT_EQ(bad_gateway.error->message, "HTTP status 502");

  auto garbage = pledge::rpc::classify_broadcast(make_http_response("ok"));
  ASSERT_TRUE(garbage.error.has_value());
  EXPECT_EQ(garbage.error->code, error_code::empty_result);
}

TEST(rpc_classifier, transport_failures_map_to_transport_and_timeout) {
  auto refused =
      pledge::rpc::classify_broadcast(pledge::testing::make_connection_failure());
  ASSERT_TRUE(refused.error.has_value());
  EXPECT_EQ(refused.error->code, error_code::transport);

  auto reset =
      pledge::rpc::classify_broadcast(pledge::testing::make_receive_failure());
  ASSERT_TRUE(reset.error.has_value());
  EXPECT_EQ(reset.error->code, error_code::transport);
  EXPECT_EQ(reset.error->message.rfind("exchange failed: ", 0), 0u);

  auto slow = pledge::rpc::classify_broadcast(pledge::testing::make_timeout());
  ASSERT_TRUE(slow.error.has_value());
  EXPECT_EQ(slow.error->code, error_code::timeout);

  auto query_slow = pledge::rpc::classify_query(pledge::testing::make_timeout());
  ASSERT_TRUE(query_slow.error.has_value());
  EXPECT_EQ(query_slow.error->code, error_code::timeout);
}

TEST(rpc_classifier, query_response_fields_are_decoded) {
  auto response = pledge::rpc::classify_query(
      make_http_response(make_query_body("eyJhIjoxfQ==")));
  ASSERT_FALSE(response.error.has_value());
  EXPECT_EQ(response.result.code, 0u);
  EXPECT_EQ(response.result.value, "eyJhIjoxfQ==");
  EXPECT_EQ(response.result.height, 7);
  EXPECT_EQ(response.result.index, 0);
  EXPECT_EQ(response.result.key, "");
  EXPECT_EQ(response.result.proof_ops, "null");
  EXPECT_FALSE(response.raw_body.empty());
}

TEST(rpc_classifier, query_code_is_execution_rejection) {
  auto response = pledge::rpc::classify_query(
      make_http_response(make_query_body("", 6, "not found")));
  ASSERT_TRUE(response.error.has_value());
  EXPECT_EQ(response.error->code, error_code::execution_rejected);
  EXPECT_EQ(response.error->log, "not found");
  EXPECT_EQ(response.result.code, 6u);
}

TEST(rpc_classifier, query_error_and_shape_rules_match_broadcast) {
  auto rpc_error = pledge::rpc::classify_query(make_http_response(
      R"({"jsonrpc":"2.0","id":-1,"error":{"code":-32602,"message":"Invalid params","data":"bad height"}})"));
  ASSERT_TRUE(rpc_error.error.has_value());
  EXPECT_EQ(rpc_error.error->code, error_code::transport);

  auto no_response = pledge::rpc::classify_query(
      make_http_response(R"({"jsonrpc":"2.0","id":-1,"result":{}})"));
  ASSERT_TRUE(no_response.error.has_value());
  EXPECT_EQ(no_response.error->code, error_code::empty_result);
}
