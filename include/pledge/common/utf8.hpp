#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace pledge::common {

inline constexpr auto kReplacementRune = char32_t{0xfffd};

struct rune final {
  char32_t value{kReplacementRune};
  std::size_t size{1};
  bool valid{false};
};

/// Decode the UTF-8 sequence starting at text[offset]. Overlong forms,
/// surrogates, truncated sequences and values above U+10FFFF are invalid and
/// consume exactly one byte.
rune decode_rune(std::string_view text, std::size_t offset);

}  // namespace pledge::common
