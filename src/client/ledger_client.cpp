#include <pledge/client/ledger_client.hpp>
#include <pledge/common/timestamp.hpp>
#include <pledge/common/unique_id.hpp>
#include <pledge/keys/identity.hpp>
#include <pledge/query/path.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace pledge::client {

namespace {

using pledge::schema::client_error_t;
using pledge::schema::error_code;
using pledge::schema::make_error;

std::optional<client_error_t> parse_due(const std::string_view flag,
                                        const std::string& value,
                                        pledge::schema::timestamp_seconds_t& out) {
  if (value.empty()) {
    return make_error(error_code::invalid_argument,
                      fmt::format("{}: missing datetime", flag));
  }
  auto parsed = pledge::common::parse_timestamp(value);
  if (!parsed) {
    return make_error(
        error_code::invalid_argument,
        fmt::format("{}: cannot parse time \"{}\" (use YYYY-MM-DD or RFC 3339)",
                    flag, value));
  }
  out = *parsed;
  return std::nullopt;
}

}  // namespace

ledger_client::ledger_client(pledge::keys::key_manager keys,
                             pledge::rpc::client rpc)
    : keys_{std::move(keys)}, rpc_{std::move(rpc)} {}

submit_result ledger_client::submit(pledge::schema::transaction_body_t body,
                                    const pledge::crypto::keypair& pair,
                                    std::string id) const {
  auto out = submit_result{.id = std::move(id)};
  auto sealed = pledge::envelope::seal(body, pair.seed);
  if (sealed.error) {
    out.error = std::move(sealed.error);
    return out;
  }
  out.broadcast = rpc_.broadcast_tx_commit(sealed.envelope->envelope_bytes);
  out.envelope = std::move(sealed.envelope);
  if (out.broadcast.error) {
    out.error = out.broadcast.error;
  }
  return out;
}

submit_result ledger_client::register_commiter(std::string name) const {
  auto loaded = keys_.ensure_keypair();
  if (loaded.error) {
    return submit_result{.error = std::move(loaded.error)};
  }
  auto body = pledge::keys::make_commiter(loaded.keypair->public_key,
                                          std::move(name));
  auto id = body.id;
  spdlog::debug("Registering commiter {}", id);
  return submit(std::move(body), *loaded.keypair, std::move(id));
}

submit_result ledger_client::create_beneficiary(std::string name) const {
  auto loaded = keys_.ensure_keypair();
  if (loaded.error) {
    return submit_result{.error = std::move(loaded.error)};
  }
  auto body = pledge::schema::beneficiary_t{
      .id = pledge::common::make_unique_id("beneficiary"),
      .name = std::move(name)};
  auto id = body.id;
  spdlog::debug("Creating beneficiary {}", id);
  return submit(std::move(body), *loaded.keypair, std::move(id));
}

submit_result ledger_client::create_promise_with_commitment(
    const promise_arguments& arguments) const {
  if (arguments.text.empty()) {
    return submit_result{.error = make_error(error_code::invalid_argument,
                                             "--text is required")};
  }
  if (arguments.beneficiary_id.empty()) {
    return submit_result{.error = make_error(error_code::invalid_argument,
                                             "--beneficiary-id is required")};
  }
  auto promise_due = pledge::schema::timestamp_seconds_t{};
  if (auto error = parse_due("promise --due", arguments.due, promise_due)) {
    return submit_result{.error = std::move(error)};
  }
  auto commitment_due = pledge::schema::timestamp_seconds_t{};
  if (auto error = parse_due("commitment --commitment-due",
                             arguments.commitment_due, commitment_due)) {
    return submit_result{.error = std::move(error)};
  }

  auto loaded = keys_.ensure_keypair();
  if (loaded.error) {
    return submit_result{.error = std::move(loaded.error)};
  }

  auto promise = pledge::schema::promise_t{
      .id = pledge::common::make_unique_id("promise"),
      .text = arguments.text,
      .due = promise_due,
      .beneficiary_id = arguments.beneficiary_id};
  if (!arguments.parent_promise_id.empty()) {
    promise.parent_promise_id = arguments.parent_promise_id;
  }
  auto commitment = pledge::schema::commitment_t{
      .id = pledge::common::make_unique_id("commitment"),
      .promise_id = promise.id,
      .commiter_id =
          pledge::keys::make_commiter_id(loaded.keypair->public_key),
      .due = commitment_due};
  auto id = promise.id;

  auto composite = pledge::envelope::make_promise_commitment(
      std::move(promise), std::move(commitment));
  if (composite.error) {
    return submit_result{.error = std::move(composite.error)};
  }
  spdlog::debug("Creating promise {} with its commitment", id);
  return submit(std::move(*composite.body), *loaded.keypair, std::move(id));
}

pledge::schema::query_response_t ledger_client::get(
    const query_arguments& arguments) const {
  auto resolved =
      pledge::query::resolve_query_path(arguments.path, arguments.alias);
  if (resolved.error) {
    return pledge::schema::query_response_t{.error = std::move(resolved.error)};
  }

  auto request = pledge::schema::query_request_t{.path = *resolved.path,
                                                 .height = arguments.height};
  if (arguments.data && !arguments.data->empty()) {
    request.data = pledge::schema::make_bytes(*arguments.data);
  }
  if (request.height && request.height->empty()) {
    request.height.reset();
  }
  return rpc_.abci_query(request);
}

identity_result ledger_client::identity() const {
  auto loaded = keys_.ensure_keypair();
  if (loaded.error) {
    return identity_result{.error = std::move(loaded.error)};
  }
  const auto& public_key = loaded.keypair->public_key;
  return identity_result{
      .id = pledge::keys::make_commiter_id(public_key),
      .public_key = pledge::schema::to_base64(
          pledge::schema::bytes_view_t{public_key.data(), public_key.size()})};
}

}  // namespace pledge::client
