#include <pledge/common/utf8.hpp>

namespace pledge::common {

namespace {

bool is_continuation(const unsigned char c) { return (c & 0xc0) == 0x80; }

}  // namespace

rune decode_rune(const std::string_view text, const std::size_t offset) {
  const auto lead = static_cast<unsigned char>(text[offset]);
  if (lead < 0x80) {
    return rune{.value = lead, .size = 1, .valid = true};
  }

  auto size = std::size_t{0};
  auto value = char32_t{0};
  auto minimum = char32_t{0};
  if ((lead & 0xe0) == 0xc0) {
    size = 2;
    value = lead & 0x1f;
    minimum = 0x80;
  } else if ((lead & 0xf0) == 0xe0) {
    size = 3;
    value = lead & 0x0f;
    minimum = 0x800;
  } else if ((lead & 0xf8) == 0xf0) {
    size = 4;
    value = lead & 0x07;
    minimum = 0x10000;
  } else {
    return rune{};
  }

  if (text.size() - offset < size) {
    return rune{};
  }
  for (auto i = std::size_t{1}; i < size; ++i) {
    const auto c = static_cast<unsigned char>(text[offset + i]);
    if (!is_continuation(c)) {
      return rune{};
    }
    value = (value << 6) | (c & 0x3f);
  }
  if (value < minimum || value > 0x10ffff ||
      (value >= 0xd800 && value <= 0xdfff)) {
    return rune{};
  }
  return rune{.value = value, .size = size, .valid = true};
}

}  // namespace pledge::common
