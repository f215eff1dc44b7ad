#include <gtest/gtest.h>
#include <pledge/config/client_config.hpp>
#include <pledge/testing/common.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace {

namespace po = boost::program_options;

using pledge::schema::error_code;

constexpr const char* kVariables[] = {"PLEDGE_RPC", "PLEDGE_KEY_DIR",
                                      "PLEDGE_TIMEOUT_MS", "PLEDGE_RETRIES",
                                      "PLEDGE_LOG_LEVEL"};

/// Sets an environment variable for the lifetime of the guard.
struct scoped_environment final {
  scoped_environment(std::string name, const std::string& value)
      : name{std::move(name)} {
    ::setenv(this->name.c_str(), value.c_str(), 1);
  }
  ~scoped_environment() { ::unsetenv(name.c_str()); }
  scoped_environment(const scoped_environment&) = delete;
  scoped_environment& operator=(const scoped_environment&) = delete;

  std::string name;
};

void clear_environment() {
  for (const auto* variable : kVariables) {
    ::unsetenv(variable);
  }
}

pledge::config::config_result resolve_arguments(
    const std::vector<std::string>& arguments) {
  auto shared = pledge::config::make_shared_options();
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(arguments).options(shared).run(), vm);
  return pledge::config::resolve(vm, shared);
}

void write_file(const std::filesystem::path& path, const std::string& text) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream{path} << text;
}

}  // namespace

TEST(client_config, defaults_apply_without_any_source) {
  clear_environment();
  auto result = resolve_arguments({});
  ASSERT_TRUE(result.config.has_value());
  EXPECT_EQ(result.config->rpc_endpoint, "http://localhost:26657");
  EXPECT_EQ(result.config->key_directory.string(), "./config");
  EXPECT_EQ(result.config->timeout.count(), 30000);
  EXPECT_EQ(result.config->max_retries, 1u);
  EXPECT_EQ(result.config->log_level, spdlog::level::warn);
  EXPECT_FALSE(result.config->log_file.has_value());
}

TEST(client_config, command_line_beats_environment_beats_file) {
  clear_environment();
  auto directory = pledge::testing::temp_directory{"pledge_config"};
  auto file = directory.path / "client.ini";
  write_file(file,
             "rpc = http://file:1\n"
             "key-dir = /file/keys\n"
             "timeout-ms = 1000\n"
             "retries = 3\n"
             "log-level = debug\n");

  auto rpc = scoped_environment{"PLEDGE_RPC", "http://env:2"};
  auto key_dir = scoped_environment{"PLEDGE_KEY_DIR", "/env/keys"};

  auto result = resolve_arguments(
      {"--config", file.string(), "--rpc", "http://cli:3"});
  ASSERT_TRUE(result.config.has_value()) << result.error->message;
  EXPECT_EQ(result.config->rpc_endpoint, "http://cli:3");
  EXPECT_EQ(result.config->key_directory.string(), "/env/keys");
  EXPECT_EQ(result.config->timeout.count(), 1000);
  EXPECT_EQ(result.config->max_retries, 3u);
  EXPECT_EQ(result.config->log_level, spdlog::level::debug);
}

TEST(client_config, zero_retries_and_log_file_are_accepted) {
  clear_environment();
  auto result =
      resolve_arguments({"--retries", "0", "--log-file", "/tmp/pledge.log"});
  ASSERT_TRUE(result.config.has_value());
  EXPECT_EQ(result.config->max_retries, 0u);
  ASSERT_TRUE(result.config->log_file.has_value());
  EXPECT_EQ(result.config->log_file->string(), "/tmp/pledge.log");
}

TEST(client_config, out_of_range_values_are_invalid_arguments) {
  clear_environment();
  for (const auto& arguments : std::vector<std::vector<std::string>>{
           {"--timeout-ms", "0"},
           {"--timeout-ms=-5"},
           {"--retries=-1"},
           {"--log-level", "loud"}}) {
    auto result = resolve_arguments(arguments);
    EXPECT_FALSE(result.config.has_value()) << arguments.front();
    ASSERT_TRUE(result.error.has_value()) << arguments.front();
    EXPECT_EQ(result.error->code, error_code::invalid_argument);
  }
}

TEST(client_config, unparseable_environment_value_is_invalid_argument) {
  clear_environment();
  auto timeout = scoped_environment{"PLEDGE_TIMEOUT_MS", "soon"};
  auto result = resolve_arguments({});
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, error_code::invalid_argument);
}

TEST(client_config, unreadable_or_unknown_config_file_is_invalid_argument) {
  clear_environment();
  auto missing = resolve_arguments({"--config", "/nonexistent/pledge.ini"});
  ASSERT_TRUE(missing.error.has_value());
  EXPECT_EQ(missing.error->code, error_code::invalid_argument);

  auto directory = pledge::testing::temp_directory{"pledge_config"};
  auto file = directory.path / "client.ini";
  write_file(file, "colour = blue\n");
  auto unknown = resolve_arguments({"--config", file.string()});
  ASSERT_TRUE(unknown.error.has_value());
  EXPECT_EQ(unknown.error->code, error_code::invalid_argument);
}

TEST(client_config, environment_names_map_to_options) {
  EXPECT_EQ(pledge::config::environment_option_name("PLEDGE_RPC"), "rpc");
  EXPECT_EQ(pledge::config::environment_option_name("PLEDGE_RETRIES"),
            "retries");
  EXPECT_EQ(pledge::config::environment_option_name("PATH"), "");
  EXPECT_EQ(pledge::config::environment_option_name("PLEDGE_CONFIG"), "");
}
