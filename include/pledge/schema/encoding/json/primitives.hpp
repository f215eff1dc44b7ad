#pragma once
#include <pledge/schema/body_type.hpp>
#include <pledge/schema/encoding/json/writer.hpp>
#include <pledge/schema/primitives.hpp>
#include <json/json.h>
#include <optional>
#include <string>
#include <string_view>

namespace pledge::schema::encoding::json {

/// Compact form of a parsed or assembled document, members in byte-wise key
/// order. Typed bodies are written through `writer` in field order instead.
std::string write_canonical(const Json::Value& document);

/// Human-facing form: two-space indentation, laid out like MarshalIndent.
std::string write_pretty(const Json::Value& document);

/// Parse one RFC 8259 JSON text (any value at the root, nothing trailing).
std::optional<Json::Value> parse(std::string_view text);
std::optional<Json::Value> parse(const pledge::schema::bytes_view_t& bytes);

void encode(const pledge::schema::body_type& o, writer& out);
bool decode(pledge::schema::body_type& o, const Json::Value& in);

void encode(const std::optional<std::string>& o, writer& out);

std::optional<std::string> read_string(const Json::Value& object,
                                       std::string_view key);
std::optional<std::optional<std::string>> read_nullable_string(
    const Json::Value& object,
    std::string_view key);

/// Accepts a JSON integer or a decimal string; CometBFT renders 64-bit
/// numbers as strings.
std::optional<int64_t> read_int64(const Json::Value& object,
                                  std::string_view key);
std::optional<uint32_t> read_uint32(const Json::Value& object,
                                    std::string_view key);

}  // namespace pledge::schema::encoding::json
