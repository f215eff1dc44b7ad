#pragma once

#include <spdlog/common.h>

#include <filesystem>
#include <optional>
#include <string_view>

namespace pledge::common {

inline constexpr auto kLoggerName = std::string_view{"pledge"};
inline constexpr auto kLogPattern =
    std::string_view{"%H:%M:%S.%e [%^%l%$] [%n] %v"};

/// trace, debug, info, warn (or warning), error, critical, off.
std::optional<spdlog::level::level_enum> parse_log_level(
    std::string_view level);

/// Install the process-wide async logger: coloured stderr plus an optional
/// append-mode file sink. Throws spdlog::spdlog_ex when the file cannot be
/// opened.
void configure_logging(spdlog::level::level_enum level,
                       const std::optional<std::filesystem::path>& log_file);

}  // namespace pledge::common
