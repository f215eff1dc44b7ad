#include <pledge/common/utf8.hpp>
#include <pledge/schema/encoding/json/writer.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace pledge::schema::encoding::json {

namespace {

constexpr auto kHex = std::string_view{"0123456789abcdef"};

void append_unicode_escape(std::string& out, const char32_t value) {
  out += "\\u";
  for (auto shift = 12; shift >= 0; shift -= 4) {
    out.push_back(kHex[(value >> shift) & 0xf]);
  }
}

// Rewrite shortest scientific notation ("1.25e-05") as plain decimal.
std::string expand_exponent(const std::string& text) {
  const auto e = text.find('e');
  auto negative = text.front() == '-';
  auto digits = text.substr(negative ? 1 : 0, e - (negative ? 1 : 0));
  digits.erase(std::remove(std::begin(digits), std::end(digits), '.'),
               std::end(digits));
  auto exponent = std::stoi(text.substr(e + 1));
  auto out = std::string{negative ? "-" : ""};
  if (exponent < 0) {
    out += "0.";
    out.append(static_cast<std::size_t>(-exponent - 1), '0');
    out += digits;
    return out;
  }
  const auto point = static_cast<std::size_t>(exponent) + 1;
  if (point >= digits.size()) {
    out += digits;
    out.append(point - digits.size(), '0');
    return out;
  }
  out += digits.substr(0, point);
  out.push_back('.');
  out += digits.substr(point);
  return out;
}

// Shortest round-trip digits; plain decimal in [1e-6, 1e21), otherwise
// an exponent without leading zeros.
std::string format_real(const double value) {
  const auto magnitude = std::fabs(value);
  if (std::trunc(value) == value && magnitude < 1e21) {
    return fmt::format("{:.0f}", value);
  }
  auto text = fmt::format("{}", value);
  const auto e = text.find('e');
  if (e == std::string::npos) {
    return text;
  }
  if (magnitude >= 1e-6 && magnitude < 1e21) {
    return expand_exponent(text);
  }
  if (e + 2 < text.size() && text[e + 2] == '0') {
    text.erase(e + 2, 1);
  }
  return text;
}

}  // namespace

std::string quote(const std::string_view text) {
  auto out = std::string{};
  out.reserve(text.size() + 2);
  out.push_back('"');
  for (auto i = std::size_t{0}; i < text.size();) {
    const auto c = static_cast<unsigned char>(text[i]);
    if (c < 0x80) {
      switch (c) {
        case '"':
          out += "\\\"";
          break;
        case '\\':
          out += "\\\\";
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
        case '<':
        case '>':
        case '&':
          append_unicode_escape(out, c);
          break;
        default:
          if (c < 0x20) {
            append_unicode_escape(out, c);
          } else {
            out.push_back(static_cast<char>(c));
          }
      }
      ++i;
      continue;
    }
    auto r = pledge::common::decode_rune(text, i);
    if (!r.valid) {
      out += "\\ufffd";
    } else if (r.value == 0x2028 || r.value == 0x2029) {
      append_unicode_escape(out, r.value);
    } else {
      out.append(text.substr(i, r.size));
    }
    i += r.size;
  }
  out.push_back('"');
  return out;
}

writer::writer(const std::string_view indent) : indent_{indent} {}

void writer::newline() {
  if (indent_.empty()) {
    return;
  }
  out_.push_back('\n');
  for (auto i = std::size_t{0}; i < stack_.size(); ++i) {
    out_ += indent_;
  }
}

void writer::separate() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (stack_.empty()) {
    return;
  }
  auto& count = stack_.back();
  if (count > 0) {
    out_.push_back(',');
  }
  ++count;
  newline();
}

void writer::open(const char bracket) {
  separate();
  out_.push_back(bracket);
  stack_.push_back(0);
}

void writer::close(const char bracket) {
  const auto count = stack_.back();
  stack_.pop_back();
  if (count > 0) {
    newline();
  }
  out_.push_back(bracket);
}

writer& writer::begin_object() {
  open('{');
  return *this;
}

writer& writer::end_object() {
  close('}');
  return *this;
}

writer& writer::begin_array() {
  open('[');
  return *this;
}

writer& writer::end_array() {
  close(']');
  return *this;
}

writer& writer::key(const std::string_view name) {
  separate();
  out_ += quote(name);
  out_ += indent_.empty() ? ":" : ": ";
  after_key_ = true;
  return *this;
}

writer& writer::string(const std::string_view value) {
  separate();
  out_ += quote(value);
  return *this;
}

writer& writer::integer(const int64_t value) {
  separate();
  out_ += std::to_string(value);
  return *this;
}

writer& writer::unsigned_integer(const uint64_t value) {
  separate();
  out_ += std::to_string(value);
  return *this;
}

writer& writer::real(const double value) {
  separate();
  out_ += format_real(value);
  return *this;
}

writer& writer::boolean(const bool value) {
  separate();
  out_ += value ? "true" : "false";
  return *this;
}

writer& writer::null() {
  separate();
  out_ += "null";
  return *this;
}

writer& writer::value(const Json::Value& document) {
  switch (document.type()) {
    case Json::nullValue:
      return null();
    case Json::intValue:
      return integer(document.asInt64());
    case Json::uintValue:
      return unsigned_integer(document.asUInt64());
    case Json::realValue:
      return real(document.asDouble());
    case Json::booleanValue:
      return boolean(document.asBool());
    case Json::stringValue: {
      const char* begin = nullptr;
      const char* end = nullptr;
      document.getString(&begin, &end);
      return string(
          std::string_view{begin, static_cast<std::size_t>(end - begin)});
    }
    case Json::arrayValue:
      begin_array();
      for (const auto& element : document) {
        value(element);
      }
      return end_array();
    case Json::objectValue:
      begin_object();
      for (const auto& name : document.getMemberNames()) {
        key(name);
        value(document[name]);
      }
      return end_object();
  }
  return *this;
}

std::string writer::release() {
  auto out = std::move(out_);
  out_.clear();
  stack_.clear();
  after_key_ = false;
  return out;
}

}  // namespace pledge::schema::encoding::json
