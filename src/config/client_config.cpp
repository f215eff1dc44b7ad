#include <pledge/common/logging.hpp>
#include <pledge/config/client_config.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <utility>

namespace pledge::config {

namespace po = boost::program_options;

namespace {

using pledge::schema::error_code;
using pledge::schema::make_error;

constexpr auto kEnvironmentOptions =
    std::array<std::pair<std::string_view, std::string_view>, 5>{{
        {"PLEDGE_RPC", "rpc"},
        {"PLEDGE_KEY_DIR", "key-dir"},
        {"PLEDGE_TIMEOUT_MS", "timeout-ms"},
        {"PLEDGE_RETRIES", "retries"},
        {"PLEDGE_LOG_LEVEL", "log-level"},
    }};

config_result invalid(std::string message) {
  return config_result{
      .error = make_error(error_code::invalid_argument, std::move(message))};
}

}  // namespace

po::options_description make_shared_options() {
  auto description = po::options_description{"Shared options"};
  description.add_options()("config", po::value<std::string>(),
                            "INI file with defaults for the options below")(
      "rpc",
      po::value<std::string>()->default_value(std::string{kDefaultRpcEndpoint}),
      "CometBFT RPC endpoint")(
      "key-dir",
      po::value<std::string>()->default_value(std::string{kDefaultKeyDirectory}),
      "Directory holding ed25519.key and ed25519.pub")(
      "timeout-ms", po::value<int64_t>()->default_value(kDefaultTimeoutMs),
      "Request timeout in milliseconds")(
      "retries", po::value<int32_t>()->default_value(kDefaultMaxRetries),
      "Retries after a connection failure")(
      "log-level",
      po::value<std::string>()->default_value(std::string{kDefaultLogLevel}),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>(), "Also append logs to this file");
  return description;
}

std::string environment_option_name(const std::string& variable) {
  for (const auto& [name, option] : kEnvironmentOptions) {
    if (variable == name) {
      return std::string{option};
    }
  }
  return {};
}

config_result resolve(po::variables_map& vm,
                      const po::options_description& shared_options) {
  try {
    // The command line is already in vm, so these only fill the gaps.
    po::store(po::parse_environment(shared_options, environment_option_name),
              vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      spdlog::debug("Reading configuration from '{}'", path);
      po::store(po::parse_config_file<char>(path.c_str(), shared_options), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    return invalid(e.what());
  }

  auto config = client_config{};
  config.rpc_endpoint = vm["rpc"].as<std::string>();
  if (config.rpc_endpoint.empty()) {
    return invalid("--rpc must not be empty");
  }
  config.key_directory = vm["key-dir"].as<std::string>();
  if (config.key_directory.empty()) {
    return invalid("--key-dir must not be empty");
  }

  auto timeout_ms = vm["timeout-ms"].as<int64_t>();
  if (timeout_ms <= 0) {
    return invalid("--timeout-ms must be positive");
  }
  config.timeout = std::chrono::milliseconds{timeout_ms};

  auto retries = vm["retries"].as<int32_t>();
  if (retries < 0) {
    return invalid("--retries must not be negative");
  }
  config.max_retries = static_cast<uint32_t>(retries);

  auto level_name = vm["log-level"].as<std::string>();
  auto level = pledge::common::parse_log_level(level_name);
  if (!level) {
    return invalid("unknown log level '" + level_name + "'");
  }
  config.log_level = *level;

  if (vm.contains("log-file")) {
    config.log_file = vm["log-file"].as<std::string>();
  }
  return config_result{.config = std::move(config)};
}

}  // namespace pledge::config
