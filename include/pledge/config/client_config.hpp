#pragma once

#include <pledge/schema/client_error.hpp>

#include <boost/program_options.hpp>
#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace pledge::config {

inline constexpr auto kDefaultRpcEndpoint =
    std::string_view{"http://localhost:26657"};
inline constexpr auto kDefaultKeyDirectory = std::string_view{"./config"};
inline constexpr auto kDefaultTimeoutMs = int64_t{30000};
inline constexpr auto kDefaultMaxRetries = int32_t{1};
inline constexpr auto kDefaultLogLevel = std::string_view{"warn"};

struct client_config final {
  std::string rpc_endpoint{kDefaultRpcEndpoint};
  std::filesystem::path key_directory{kDefaultKeyDirectory};
  std::chrono::milliseconds timeout{kDefaultTimeoutMs};
  uint32_t max_retries{static_cast<uint32_t>(kDefaultMaxRetries)};
  spdlog::level::level_enum log_level{spdlog::level::warn};
  std::optional<std::filesystem::path> log_file;
};

struct config_result final {
  std::optional<client_config> config;
  std::optional<pledge::schema::client_error_t> error;
};

/// Options every command accepts: config, key-dir, rpc, timeout-ms, retries,
/// log-level, log-file.
boost::program_options::options_description make_shared_options();

/// Maps PLEDGE_RPC, PLEDGE_KEY_DIR, PLEDGE_TIMEOUT_MS, PLEDGE_RETRIES and
/// PLEDGE_LOG_LEVEL to option names. Anything else maps to "".
std::string environment_option_name(const std::string& variable);

/// Complete `vm`, which already holds the parsed command line, with the
/// environment and then the `--config` file, and build the typed config.
///
/// Earlier sources win: command line, environment, file, defaults. Parse or
/// range failures are invalid_argument errors.
config_result resolve(boost::program_options::variables_map& vm,
                      const boost::program_options::options_description&
                          shared_options);

}  // namespace pledge::config
