#include <pledge/schema/encoding/json/primitives.hpp>

#include <charconv>
#include <memory>
#include <string>

using namespace pledge::schema;

namespace pledge::schema::encoding::json {

namespace {

Json::CharReaderBuilder make_reader() {
  auto builder = Json::CharReaderBuilder{};
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["allowTrailingCommas"] = false;
  builder["strictRoot"] = false;
  builder["allowDroppedNullPlaceholders"] = false;
  builder["allowNumericKeys"] = false;
  builder["allowSingleQuotes"] = false;
  builder["failIfExtra"] = true;
  builder["rejectDupKeys"] = false;
  builder["allowSpecialFloats"] = false;
  builder["skipBom"] = false;
  return builder;
}

const Json::Value* find_member(const Json::Value& object,
                               const std::string_view key) {
  if (!object.isObject()) {
    return nullptr;
  }
  return object.find(key.data(), key.data() + key.size());
}

template <typename Integer>
std::optional<Integer> parse_decimal(const std::string& text) {
  auto value = Integer{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last || text.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::string write_canonical(const Json::Value& document) {
  auto out = writer{};
  out.value(document);
  return out.release();
}

std::string write_pretty(const Json::Value& document) {
  auto out = writer{"  "};
  out.value(document);
  return out.release();
}

std::optional<Json::Value> parse(const std::string_view text) {
  static const auto builder = make_reader();
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  auto document = Json::Value{};
  auto errors = std::string{};
  if (!reader->parse(text.data(), text.data() + text.size(), &document,
                     &errors)) {
    return std::nullopt;
  }
  return document;
}

std::optional<Json::Value> parse(const bytes_view_t& bytes) {
  return parse(make_string_view(bytes));
}

void encode(const body_type& o, writer& out) {
  auto name = to_string(o, kBodyTypeNames);
  out.string(name.value_or(""));
}

bool decode(body_type& o, const Json::Value& in) {
  if (!in.isString()) {
    return false;
  }
  auto parsed = from_string(in.asString(), kBodyTypeNames);
  if (!parsed) {
    return false;
  }
  o = *parsed;
  return true;
}

void encode(const std::optional<std::string>& o, writer& out) {
  if (!o) {
    out.null();
    return;
  }
  out.string(*o);
}

std::optional<std::string> read_string(const Json::Value& object,
                                       const std::string_view key) {
  const auto* member = find_member(object, key);
  if (member == nullptr || !member->isString()) {
    return std::nullopt;
  }
  return member->asString();
}

std::optional<std::optional<std::string>> read_nullable_string(
    const Json::Value& object,
    const std::string_view key) {
  const auto* member = find_member(object, key);
  if (member == nullptr) {
    return std::nullopt;
  }
  if (member->isNull()) {
    return std::optional<std::string>{};
  }
  if (!member->isString()) {
    return std::nullopt;
  }
  return std::optional<std::string>{member->asString()};
}

std::optional<int64_t> read_int64(const Json::Value& object,
                                  const std::string_view key) {
  const auto* member = find_member(object, key);
  if (member == nullptr) {
    return std::nullopt;
  }
  if (member->isString()) {
    return parse_decimal<int64_t>(member->asString());
  }
  if (!member->isIntegral() || !member->isInt64()) {
    return std::nullopt;
  }
  return static_cast<int64_t>(member->asInt64());
}

std::optional<uint32_t> read_uint32(const Json::Value& object,
                                    const std::string_view key) {
  const auto* member = find_member(object, key);
  if (member == nullptr) {
    return std::nullopt;
  }
  if (member->isString()) {
    return parse_decimal<uint32_t>(member->asString());
  }
  if (!member->isIntegral() || !member->isUInt()) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(member->asUInt());
}

}  // namespace pledge::schema::encoding::json
