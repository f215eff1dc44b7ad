#include <pledge/common/logging.hpp>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <utility>
#include <vector>

namespace pledge::common {

namespace {

constexpr auto kLevelNames =
    std::array<std::pair<std::string_view, spdlog::level::level_enum>, 8>{{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};

}  // namespace

std::optional<spdlog::level::level_enum> parse_log_level(
    const std::string_view level) {
  for (const auto& [name, value] : kLevelNames) {
    if (name == level) {
      return value;
    }
  }
  return std::nullopt;
}

void configure_logging(const spdlog::level::level_enum level,
                       const std::optional<std::filesystem::path>& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (log_file) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        log_file->string(), false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      std::string{kLoggerName}, std::begin(sinks), std::end(sinks),
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  logger->set_pattern(std::string{kLogPattern});
  logger->set_level(level);

  spdlog::set_default_logger(logger);
}

}  // namespace pledge::common
