#pragma once

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace pledge::common {

/// Log a broken internal invariant and terminate. Reserved for programming
/// defects and unusable process state; recoverable failures travel as
/// client errors.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::terminate();
}

}  // namespace pledge::common
