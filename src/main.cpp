#include <boost/program_options.hpp>
#include <pledge/client/ledger_client.hpp>
#include <pledge/common/logging.hpp>
#include <pledge/config/client_config.hpp>
#include <pledge/query/value_decoder.hpp>
#include <pledge/rpc/transport.hpp>
#include <pledge/schema/encoding/json/primitives.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <string_view>

namespace {

namespace po = boost::program_options;

constexpr auto kUsage = std::string_view{
    "Usage:\n"
    "  pledge_client send [--rpc URL] (--name NAME | --beneficiary-name NAME "
    "| --text TXT --due DATE --beneficiary-id ID [--parent-id ID] "
    "--commitment-due DATE)\n"
    "  pledge_client get  [--rpc URL] (--path PATH | --list ALIAS) "
    "[--data BYTES] [--height H] [--raw-json | --value]\n"
    "  pledge_client identity\n"
    "Run 'pledge_client <command> --help' for the options of a command.\n"};

struct send_options final {
  std::string name;
  std::string beneficiary_name;
  pledge::client::promise_arguments promise;
};

struct get_options final {
  pledge::client::query_arguments query;
  bool raw_json{};
  bool value{};
};

po::options_description make_send_options(send_options& options) {
  auto description = po::options_description{"send"};
  description.add_options()("help,h", "Show the help message")(
      "name", po::value<std::string>(&options.name),
      "Register the local identity under NAME")(
      "beneficiary-name", po::value<std::string>(&options.beneficiary_name),
      "Create a beneficiary named NAME and print its id")(
      "text", po::value<std::string>(&options.promise.text),
      "Promise text")("due", po::value<std::string>(&options.promise.due),
                      "Promise due date (YYYY-MM-DD or RFC 3339)")(
      "beneficiary-id",
      po::value<std::string>(&options.promise.beneficiary_id),
      "Beneficiary the promise is made to")(
      "parent-id", po::value<std::string>(&options.promise.parent_promise_id),
      "Parent promise id")(
      "commitment-due",
      po::value<std::string>(&options.promise.commitment_due),
      "Commitment due date (YYYY-MM-DD or RFC 3339)");
  return description;
}

po::options_description make_get_options(get_options& options) {
  auto description = po::options_description{"get"};
  description.add_options()("help,h", "Show the help message")(
      "path", po::value<std::string>(&options.query.path),
      "ABCI query path, e.g. /list/promise")(
      "list", po::value<std::string>(&options.query.alias),
      "Entity alias: promise | commitment | commiter | beneficiary")(
      "data", po::value<std::string>(),
      "Query argument, sent as base64")(
      "height", po::value<std::string>(), "Block height")(
      "raw-json", po::bool_switch(&options.raw_json),
      "Print the whole JSON-RPC response")(
      "value", po::bool_switch(&options.value),
      "Print the decoded response value (default)");
  return description;
}

po::options_description make_identity_options() {
  auto description = po::options_description{"identity"};
  description.add_options()("help,h", "Show the help message");
  return description;
}

int fail(const pledge::schema::client_error_t& error) {
  std::cerr << "Error: " << pledge::schema::describe(error) << std::endl;
  return 1;
}

int run_send(const pledge::client::ledger_client& client,
             send_options& options) {
  if (!options.name.empty()) {
    auto result = client.register_commiter(std::move(options.name));
    if (result.error) {
      return fail(*result.error);
    }
    std::cout << "Commiter registered: " << result.id << std::endl;
    return 0;
  }
  if (!options.beneficiary_name.empty()) {
    auto result = client.create_beneficiary(std::move(options.beneficiary_name));
    if (result.error) {
      return fail(*result.error);
    }
    std::cout << "Beneficiary created: " << result.id << std::endl;
    return 0;
  }
  auto result = client.create_promise_with_commitment(options.promise);
  if (result.error) {
    return fail(*result.error);
  }
  std::cout << "Promise+Commitment created atomically: " << result.id
            << std::endl;
  return 0;
}

int run_get(const pledge::client::ledger_client& client,
            const get_options& options) {
  auto response = client.get(options.query);
  if (response.error) {
    return fail(*response.error);
  }

  if (options.raw_json) {
    auto document = pledge::schema::encoding::json::parse(response.raw_body);
    if (!document) {
      std::cout << response.raw_body << std::endl;
    } else {
      std::cout << pledge::schema::encoding::json::write_pretty(*document)
                << std::endl;
    }
    return 0;
  }

  auto decoded = pledge::query::decode_value(response.result.value);
  if (decoded.error) {
    std::cerr << "Warning: " << decoded.error->message << std::endl;
    std::cout << response.result.value << std::endl;
    return 1;
  }
  std::cout << decoded.view->text << std::endl;
  return 0;
}

int run_identity(const pledge::client::ledger_client& client) {
  auto result = client.identity();
  if (result.error) {
    return fail(*result.error);
  }
  std::cout << "id: " << result.id << std::endl;
  std::cout << "public_key: " << result.public_key << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::cerr << kUsage;
    return 1;
  }
  auto command = std::string_view{argv[1]};
  if (command == "--help" || command == "-h" || command == "help") {
    std::cout << kUsage;
    return 0;
  }

  auto send_arguments = send_options{};
  auto get_arguments = get_options{};
  auto shared = pledge::config::make_shared_options();
  auto description = po::options_description{};
  if (command == "send") {
    description.add(make_send_options(send_arguments));
  } else if (command == "get") {
    description.add(make_get_options(get_arguments));
  } else if (command == "identity") {
    description.add(make_identity_options());
  } else {
    std::cerr << "Unknown command '" << command << "'\n" << kUsage;
    return 1;
  }
  description.add(shared);

  // argv[1] is the command and takes the program name slot.
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc - 1, argv + 1, description), vm);
  } catch (const po::error& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  auto resolved = pledge::config::resolve(vm, shared);
  if (resolved.error) {
    return fail(*resolved.error);
  }
  const auto& config = *resolved.config;

  try {
    pledge::common::configure_logging(config.log_level, config.log_file);
  } catch (const spdlog::spdlog_ex& e) {
    std::cerr << "Error: cannot set up logging: " << e.what() << std::endl;
    return 1;
  }
  spdlog::debug("Using RPC endpoint {} and key directory '{}'",
                config.rpc_endpoint, config.key_directory.string());

  auto client = pledge::client::ledger_client{
      pledge::keys::key_manager{config.key_directory},
      pledge::rpc::client{config.rpc_endpoint,
                          pledge::rpc::make_curl_transport(config.timeout),
                          config.max_retries}};

  auto status = 0;
  if (command == "send") {
    status = run_send(client, send_arguments);
  } else if (command == "get") {
    if (vm.contains("data")) {
      get_arguments.query.data = vm["data"].as<std::string>();
    }
    if (vm.contains("height")) {
      get_arguments.query.height = vm["height"].as<std::string>();
    }
    status = run_get(client, get_arguments);
  } else {
    status = run_identity(client);
  }

  spdlog::shutdown();
  return status;
}
