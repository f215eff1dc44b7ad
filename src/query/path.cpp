#include <pledge/common/utf8.hpp>
#include <pledge/query/path.hpp>

#include <spdlog/fmt/fmt.h>

namespace pledge::query {

using pledge::schema::error_code;
using pledge::schema::make_error;

namespace {

// Non-ASCII code points left unescaped by quote_path: everything except the
// C1 controls and the format and separator characters below.
bool is_printable(const char32_t value) {
  if (value >= 0x80 && value <= 0xa0) {
    return false;
  }
  if (value >= 0x2000 && value <= 0x200f) {
    return false;
  }
  if (value >= 0x2028 && value <= 0x202f) {
    return false;
  }
  if (value >= 0x205f && value <= 0x2064) {
    return false;
  }
  if (value >= 0xfff9 && value <= 0xfffb) {
    return false;
  }
  switch (value) {
    case 0xad:
    case 0x1680:
    case 0x3000:
    case 0xfeff:
    case 0xfffe:
    case 0xffff:
      return false;
    default:
      return true;
  }
}

}  // namespace

path_result resolve_query_path(const std::string_view path,
                               const std::string_view alias) {
  if (!path.empty()) {
    return path_result{.path = std::string{path}};
  }
  if (alias.empty()) {
    return path_result{.error = make_error(error_code::invalid_argument,
                                           "either --path or --list is required")};
  }
  auto entity = pledge::schema::from_string(alias,
                                            pledge::schema::kEntityAliasNames);
  if (!entity) {
    return path_result{
        .error = make_error(error_code::invalid_argument,
                            fmt::format("unknown alias for --list: \"{}\"",
                                        alias))};
  }
  return path_result{.path = std::string{kListPathPrefix} + std::string{alias}};
}

std::string quote_path(const std::string_view path) {
  auto out = std::string{};
  out.reserve(path.size() + 2);
  out.push_back('"');
  for (auto i = std::size_t{0}; i < path.size();) {
    const auto c = static_cast<unsigned char>(path[i]);
    if (c < 0x80) {
      switch (c) {
        case '"':
          out += "\\\"";
          break;
        case '\\':
          out += "\\\\";
          break;
        case '\a':
          out += "\\a";
          break;
        case '\b':
          out += "\\b";
          break;
        case '\f':
          out += "\\f";
          break;
        case '\n':
          out += "\\n";
          break;
        case '\r':
          out += "\\r";
          break;
        case '\t':
          out += "\\t";
          break;
        case '\v':
          out += "\\v";
          break;
        default:
          if (c < 0x20 || c == 0x7f) {
            out += fmt::format("\\x{:02x}", static_cast<unsigned>(c));
          } else {
            out.push_back(static_cast<char>(c));
          }
      }
      ++i;
      continue;
    }
    auto r = pledge::common::decode_rune(path, i);
    if (!r.valid) {
      out += fmt::format("\\x{:02x}", static_cast<unsigned>(c));
    } else if (is_printable(r.value)) {
      out.append(path.substr(i, r.size));
    } else if (r.value < 0x10000) {
      out += fmt::format("\\u{:04x}", static_cast<uint32_t>(r.value));
    } else {
      out += fmt::format("\\U{:08x}", static_cast<uint32_t>(r.value));
    }
    i += r.size;
  }
  out.push_back('"');
  return out;
}

}  // namespace pledge::query
