#include <gtest/gtest.h>
#include <pledge/rpc/client.hpp>
#include <pledge/schema/encoding/json/primitives.hpp>
#include <pledge/testing/scripted_transport.hpp>

#include <memory>
#include <string>

namespace {

namespace json = pledge::schema::encoding::json;

std::shared_ptr<pledge::testing::scripted_transport> make_script(
    std::vector<pledge::rpc::http_response> responses) {
  auto script = std::make_shared<pledge::testing::scripted_transport>();
  script->responses = std::move(responses);
  return script;
}

std::string query_value(const pledge::rpc::http_request& request,
                        const std::string_view name) {
  for (const auto& [key, value] : request.query) {
    if (key == name) {
      return value;
    }
  }
  return {};
}

}  // namespace

TEST(rpc_client, broadcast_posts_json_rpc_request) {
  auto script = make_script({pledge::testing::make_http_response(
      pledge::testing::make_broadcast_body(0, "", 0, ""))});
  auto client = pledge::rpc::client{"http://node:26657/",
                                    pledge::testing::make_transport(script), 1};
  auto envelope = std::string{R"({"body":{},"signature":""})"};

  auto result =
      client.broadcast_tx_commit(pledge::schema::make_bytes_view(envelope));
  EXPECT_FALSE(result.error.has_value());
  ASSERT_EQ(script->requests.size(), 1u);

  const auto& request = script->requests.front();
  EXPECT_EQ(request.method, pledge::rpc::http_method::post);
  EXPECT_EQ(request.url, "http://node:26657");
  EXPECT_EQ(request.content_type, "application/json");

  auto document = json::parse(request.body);
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ((*document)["jsonrpc"].asString(), "2.0");
  EXPECT_EQ((*document)["method"].asString(), "broadcast_tx_commit");
  EXPECT_EQ((*document)["id"].asString().size(), 36u);
  EXPECT_EQ((*document)["params"]["tx"].asString(),
            pledge::schema::to_base64(std::string_view{envelope}));
}

TEST(rpc_client, request_ids_are_unique) {
  auto envelope = std::string{"{}"};
  auto first = pledge::rpc::make_broadcast_request(
      pledge::schema::make_bytes_view(envelope));
  auto second = pledge::rpc::make_broadcast_request(
      pledge::schema::make_bytes_view(envelope));
  EXPECT_NE(first, second);
}

TEST(rpc_client, connection_failure_is_retried_once) {
  auto script = make_script(
      {pledge::testing::make_connection_failure(),
       pledge::testing::make_http_response(
           pledge::testing::make_broadcast_body(0, "", 0, ""))});
  auto client = pledge::rpc::client{"http://node:26657",
                                    pledge::testing::make_transport(script), 1};
  auto envelope = std::string{"{}"};
  auto result =
      client.broadcast_tx_commit(pledge::schema::make_bytes_view(envelope));
  EXPECT_FALSE(result.error.has_value());
  EXPECT_EQ(script->requests.size(), 2u);
}

TEST(rpc_client, persistent_connection_failure_stops_after_one_retry) {
  auto script = make_script({pledge::testing::make_connection_failure(),
                             pledge::testing::make_connection_failure(),
                             pledge::testing::make_connection_failure()});
  auto client = pledge::rpc::client{"http://node:26657",
                                    pledge::testing::make_transport(script), 1};
  auto envelope = std::string{"{}"};
  auto result =
      client.broadcast_tx_commit(pledge::schema::make_bytes_view(envelope));
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, pledge::schema::error_code::transport);
  EXPECT_EQ(script->requests.size(), 2u);
}

TEST(rpc_client, zero_retries_sends_exactly_once) {
  auto script = make_script({pledge::testing::make_connection_failure(),
                             pledge::testing::make_connection_failure()});
  auto client = pledge::rpc::client{"http://node:26657",
                                    pledge::testing::make_transport(script), 0};
  auto envelope = std::string{"{}"};
  auto result =
      client.broadcast_tx_commit(pledge::schema::make_bytes_view(envelope));
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(script->requests.size(), 1u);
}

TEST(rpc_client, http_responses_and_timeouts_are_never_retried) {
  auto rejected = make_script({pledge::testing::make_http_response(
      pledge::testing::make_broadcast_body(1, "nope", 0, ""))});
  auto client = pledge::rpc::client{
      "http://node:26657", pledge::testing::make_transport(rejected), 1};
  auto envelope = std::string{"{}"};
  auto result =
      client.broadcast_tx_commit(pledge::schema::make_bytes_view(envelope));
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, pledge::schema::error_code::validation_rejected);
  EXPECT_EQ(rejected->requests.size(), 1u);

  auto server_error =
      make_script({pledge::testing::make_http_response("oops", 500)});
  auto server_client = pledge::rpc::client{
      "http://node:26657", pledge::testing::make_transport(server_error), 1};
  auto failed = server_client.broadcast_tx_commit(
      pledge::schema::make_bytes_view(envelope));
  ASSERT_TRUE(failed.error.has_value());
  EXPECT_EQ(failed.error->code, pledge::schema::error_code::transport);
  EXPECT_EQ(server_error->requests.size(), 1u);

  auto slow = make_script({pledge::testing::make_timeout(),
                           pledge::testing::make_http_response(
                               pledge::testing::make_broadcast_body(0, "", 0, ""))});
  auto slow_client = pledge::rpc::client{
      "http://node:26657", pledge::testing::make_transport(slow), 1};
  auto timed_out =
      slow_client.broadcast_tx_commit(pledge::schema::make_bytes_view(envelope));
  ASSERT_TRUE(timed_out.error.has_value());
  EXPECT_EQ(timed_out.error->code, pledge::schema::error_code::timeout);
  EXPECT_EQ(slow->requests.size(), 1u);
}

TEST(rpc_client, abci_query_sends_quoted_path_base64_data_and_verbatim_height) {
  auto script = make_script({pledge::testing::make_http_response(
      pledge::testing::make_query_body("aGVsbG8="))});
  auto client = pledge::rpc::client{"http://node:26657",
                                    pledge::testing::make_transport(script), 1};

  auto request = pledge::schema::query_request_t{
      .path = "/list/promise",
      .data = pledge::schema::make_bytes(std::string_view{"key-1"}),
      .height = "12"};
  auto response = client.abci_query(request);
  EXPECT_FALSE(response.error.has_value());
  EXPECT_EQ(response.result.value, "aGVsbG8=");

  ASSERT_EQ(script->requests.size(), 1u);
  const auto& sent = script->requests.front();
  EXPECT_EQ(sent.method, pledge::rpc::http_method::get);
  EXPECT_EQ(sent.url, "http://node:26657/abci_query");
  EXPECT_EQ(query_value(sent, "path"), "\"/list/promise\"");
  EXPECT_EQ(query_value(sent, "data"), "a2V5LTE=");
  EXPECT_EQ(query_value(sent, "height"), "12");
}

TEST(rpc_client, abci_query_omits_absent_data_and_height) {
  auto script = make_script({pledge::testing::make_http_response(
      pledge::testing::make_query_body(""))});
  auto client = pledge::rpc::client{"http://node:26657",
                                    pledge::testing::make_transport(script), 1};
  auto response =
      client.abci_query(pledge::schema::query_request_t{.path = "/list/commiter"});
  EXPECT_FALSE(response.error.has_value());
  ASSERT_EQ(script->requests.size(), 1u);
  EXPECT_EQ(script->requests.front().query.size(), 1u);
}

TEST(rpc_client, trim_endpoint_drops_trailing_slashes) {
  EXPECT_EQ(pledge::rpc::trim_endpoint("http://a:1//"), "http://a:1");
  EXPECT_EQ(pledge::rpc::trim_endpoint("http://a:1"), "http://a:1");
  EXPECT_EQ(pledge::rpc::trim_endpoint("/"), "");
}

TEST(rpc_client, broken_exchange_is_not_resent) {
  auto script = make_script(
      {pledge::testing::make_receive_failure(),
       pledge::testing::make_http_response(
           pledge::testing::make_broadcast_body(0, "", 0, ""))});
  auto client = pledge::rpc::client{"http://node:26657",
                                    pledge::testing::make_transport(script), 3};
  auto envelope = std::string{"{}"};
  auto result =
      client.broadcast_tx_commit(pledge::schema::make_bytes_view(envelope));
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, pledge::schema::error_code::transport);
  EXPECT_NE(result.error->message.find("Connection reset by peer"),
            std::string::npos);
  EXPECT_EQ(script->requests.size(), 1u);
}
