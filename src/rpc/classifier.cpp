#include <pledge/rpc/classifier.hpp>
#include <pledge/schema/encoding/json/primitives.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <json/json.h>

namespace pledge::rpc {

namespace json = pledge::schema::encoding::json;

namespace {

using pledge::schema::client_error_t;
using pledge::schema::error_code;
using pledge::schema::make_error;

bool is_success_status(const int64_t status_code) {
  return status_code >= 200 && status_code < 300;
}

std::string render(const Json::Value& value) {
  if (value.isString()) {
    return value.asString();
  }
  if (value.isNull()) {
    return {};
  }
  return json::write_canonical(value);
}

client_error_t transport_failure(const http_response& response) {
  if (response.status == transport_status::timed_out) {
    return make_error(error_code::timeout,
                      "request timed out: " + response.error);
  }
  if (response.status == transport_status::exchange_failed) {
    return make_error(error_code::transport,
                      "exchange failed: " + response.error);
  }
  return make_error(error_code::transport,
                    "connection failed: " + response.error);
}

client_error_t rpc_error(const Json::Value& error) {
  auto out = make_error(error_code::transport, {});
  out.remote_code = json::read_int64(error, "code");
  out.remote_data = render(error.isObject() ? error["data"] : Json::Value{});
  auto message = error.isObject()
                     ? json::read_string(error, "message").value_or("")
                     : render(error);
  out.message = fmt::format("RPC error: {} {} ({})", out.remote_code.value_or(0),
                            message, out.remote_data);
  return out;
}

// Shared envelope checks of both paths. On success `result` points at the
// `result` object of `document`.
std::optional<client_error_t> classify_envelope(
    const http_response& response,
    std::optional<Json::Value>& document,
    const Json::Value*& result) {
  if (response.status != transport_status::ok) {
    return transport_failure(response);
  }

  document = json::parse(response.body);
  if (!document || !document->isObject()) {
    if (!is_success_status(response.status_code)) {
      return make_error(error_code::transport,
                        fmt::format("HTTP status {}", response.status_code));
    }
    return make_error(error_code::empty_result, "response is not a JSON object");
  }

  const auto& root = *document;
  const auto& error = root["error"];
  if (!error.isNull()) {
    return rpc_error(error);
  }

  const auto& result_member = root["result"];
  if (!result_member.isObject()) {
    return make_error(error_code::empty_result, "empty result");
  }
  result = &result_member;
  return std::nullopt;
}

// A missing stage reads as code 0.
std::optional<pledge::schema::tx_stage_result> read_stage(
    const Json::Value& result,
    const std::string_view name) {
  const auto* stage = result.find(name.data(), name.data() + name.size());
  auto out = pledge::schema::tx_stage_result{};
  if (stage == nullptr || stage->isNull()) {
    return out;
  }
  if (!stage->isObject()) {
    return std::nullopt;
  }
  if (stage->isMember("code")) {
    auto code = json::read_uint32(*stage, "code");
    if (!code) {
      return std::nullopt;
    }
    out.code = *code;
  }
  out.log = json::read_string(*stage, "log").value_or("");
  out.codespace = json::read_string(*stage, "codespace").value_or("");
  return out;
}

}  // namespace

pledge::schema::broadcast_result_t classify_broadcast(
    const http_response& response) {
  auto out = pledge::schema::broadcast_result_t{};
  auto document = std::optional<Json::Value>{};
  const auto* result = static_cast<const Json::Value*>(nullptr);
  if (auto error = classify_envelope(response, document, result)) {
    out.error = std::move(error);
    return out;
  }

  auto check_tx = read_stage(*result, "check_tx");
  auto deliver_tx = result->isMember("deliver_tx")
                        ? read_stage(*result, "deliver_tx")
                        : read_stage(*result, "tx_result");
  if (!check_tx || !deliver_tx) {
    out.error = make_error(error_code::empty_result,
                           "malformed check_tx or deliver_tx");
    return out;
  }
  out.check_tx = std::move(*check_tx);
  out.deliver_tx = std::move(*deliver_tx);
  out.hash = json::read_string(*result, "hash").value_or("");
  out.height = json::read_int64(*result, "height").value_or(0);

  if (out.check_tx.code != 0) {
    auto error = make_error(error_code::validation_rejected,
                            "CheckTx failed: " + out.check_tx.log);
    error.remote_code = out.check_tx.code;
    error.log = out.check_tx.log;
    out.error = std::move(error);
    return out;
  }
  if (out.deliver_tx.code != 0) {
    auto error = make_error(error_code::execution_rejected,
                            "DeliverTx failed: " + out.deliver_tx.log);
    error.remote_code = out.deliver_tx.code;
    error.log = out.deliver_tx.log;
    out.error = std::move(error);
    return out;
  }
  return out;
}

pledge::schema::query_response_t classify_query(
    const http_response& response) {
  auto out = pledge::schema::query_response_t{};
  out.raw_body = response.body;
  auto document = std::optional<Json::Value>{};
  const auto* result = static_cast<const Json::Value*>(nullptr);
  if (auto error = classify_envelope(response, document, result)) {
    out.error = std::move(error);
    return out;
  }

  const auto& query = (*result)["response"];
  if (!query.isObject()) {
    out.error = make_error(error_code::empty_result, "empty query response");
    return out;
  }
  auto code = query.isMember("code") ? json::read_uint32(query, "code")
                                     : std::optional<uint32_t>{0};
  if (!code) {
    out.error = make_error(error_code::empty_result, "malformed query code");
    return out;
  }

  auto& fields = out.result;
  fields.code = *code;
  fields.log = json::read_string(query, "log").value_or("");
  fields.info = json::read_string(query, "info").value_or("");
  fields.index = json::read_int64(query, "index").value_or(0);
  fields.key = json::read_string(query, "key").value_or("");
  fields.value = json::read_string(query, "value").value_or("");
  fields.proof_ops = json::write_canonical(query["proofOps"]);
  fields.height = json::read_int64(query, "height").value_or(0);
  fields.codespace = json::read_string(query, "codespace").value_or("");

  if (fields.code != 0) {
    auto error = make_error(error_code::execution_rejected,
                            "query failed: " + fields.log);
    error.remote_code = fields.code;
    error.log = fields.log;
    out.error = std::move(error);
  }
  return out;
}

}  // namespace pledge::rpc
