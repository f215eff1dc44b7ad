#include <gtest/gtest.h>
#include <pledge/query/path.hpp>
#include <pledge/query/value_decoder.hpp>
#include <pledge/schema/primitives.hpp>

#include <string>
#include <string_view>

using pledge::schema::error_code;
using pledge::schema::view_kind;

TEST(query_path, alias_resolves_to_list_path) {
  for (const auto* alias : {"promise", "commitment", "commiter", "beneficiary"}) {
    auto resolved = pledge::query::resolve_query_path("", alias);
    ASSERT_TRUE(resolved.path.has_value()) << alias;
    EXPECT_EQ(*resolved.path, std::string{"/list/"} + alias);
  }
}

TEST(query_path, explicit_path_overrides_alias) {
  auto resolved = pledge::query::resolve_query_path("/get/promise", "commitment");
  ASSERT_TRUE(resolved.path.has_value());
  EXPECT_EQ(*resolved.path, "/get/promise");

  auto unknown_alias_ignored =
      pledge::query::resolve_query_path("/custom", "nonsense");
  ASSERT_TRUE(unknown_alias_ignored.path.has_value());
  EXPECT_EQ(*unknown_alias_ignored.path, "/custom");
}

TEST(query_path, unknown_or_missing_alias_is_invalid_argument) {
  auto unknown = pledge::query::resolve_query_path("", "promises");
  ASSERT_TRUE(unknown.error.has_value());
  EXPECT_EQ(unknown.error->code, error_code::invalid_argument);

  auto neither = pledge::query::resolve_query_path("", "");
  ASSERT_TRUE(neither.error.has_value());
  EXPECT_EQ(neither.error->code, error_code::invalid_argument);
}

TEST(query_path, quote_path_wraps_and_escapes) {
  EXPECT_EQ(pledge::query::quote_path("/list/promise"), "\"/list/promise\"");
  EXPECT_EQ(pledge::query::quote_path(R"(/a"b\c)"), R"("/a\"b\\c")");
  EXPECT_EQ(pledge::query::quote_path("a\nb"), "\"a\\nb\"");
  EXPECT_EQ(pledge::query::quote_path(""), "\"\"");
}

TEST(query_path, quote_path_uses_c_escapes_and_hex_for_other_bytes) {
  EXPECT_EQ(pledge::query::quote_path("\a\b\f\v"), "\"\\a\\b\\f\\v\"");
  EXPECT_EQ(pledge::query::quote_path("x\x01\x7f"), "\"x\\x01\\x7f\"");
  EXPECT_EQ(pledge::query::quote_path("a\xff"), "\"a\\xff\"");
  EXPECT_EQ(pledge::query::quote_path("/get/caf\xC3\xA9"),
            "\"/get/caf\xC3\xA9\"");
  EXPECT_EQ(pledge::query::quote_path("\xC2\x85|\xE2\x80\xA8"),
            "\"\\u0085|\\u2028\"");
}

TEST(value_decoder, empty_value_is_empty_view_not_error) {
  auto decoded = pledge::query::decode_value("");
  ASSERT_FALSE(decoded.error.has_value());
  ASSERT_TRUE(decoded.view.has_value());
  EXPECT_EQ(decoded.view->kind, view_kind::empty);
  EXPECT_TRUE(decoded.view->text.empty());
}

TEST(value_decoder, json_value_is_pretty_printed) {
  // {"b":1,"a":"x"}
  auto decoded = pledge::query::decode_value("eyJiIjoxLCJhIjoieCJ9");
  ASSERT_TRUE(decoded.view.has_value());
  EXPECT_EQ(decoded.view->kind, view_kind::json);
  EXPECT_EQ(decoded.view->text, "{\n  \"a\": \"x\",\n  \"b\": 1\n}");
}

TEST(value_decoder, json_arrays_list_one_element_per_line) {
  auto text = std::string{R"({"list":[1,"two",{}],"none":[],"ok":true})"};
  auto decoded = pledge::query::decode_value(
      pledge::schema::to_base64(std::string_view{text}));
  ASSERT_TRUE(decoded.view.has_value());
  EXPECT_EQ(decoded.view->kind, view_kind::json);
  EXPECT_EQ(decoded.view->text,
            "{\n"
            "  \"list\": [\n"
            "    1,\n"
            "    \"two\",\n"
            "    {}\n"
            "  ],\n"
            "  \"none\": [],\n"
            "  \"ok\": true\n"
            "}");
}

TEST(value_decoder, text_value_is_verbatim) {
  auto decoded = pledge::query::decode_value("aGVsbG8gd29ybGQ=");
  ASSERT_TRUE(decoded.view.has_value());
  EXPECT_EQ(decoded.view->kind, view_kind::text);
  EXPECT_EQ(decoded.view->text, "hello world");
}

TEST(value_decoder, nul_byte_value_is_shown_as_base64) {
  // "a\0b"
  auto decoded = pledge::query::decode_value("YQBi");
  ASSERT_TRUE(decoded.view.has_value());
  EXPECT_EQ(decoded.view->kind, view_kind::base64);
  EXPECT_EQ(decoded.view->text, "YQBi");
  EXPECT_EQ(decoded.view->raw, (pledge::schema::bytes_t{'a', 0x00, 'b'}));
}

TEST(value_decoder, json_prefix_before_nul_byte_is_not_json) {
  auto raw = pledge::schema::bytes_t{'{', '"', 'a', '"', ':', '1', '}',
                                     0x00, 0x01, 0x02, 'b', 'i', 'n'};
  auto encoded = pledge::schema::to_base64(raw);
  auto decoded = pledge::query::decode_value(encoded);
  ASSERT_TRUE(decoded.view.has_value());
  EXPECT_EQ(decoded.view->kind, view_kind::base64);
  EXPECT_EQ(decoded.view->text, encoded);
  EXPECT_EQ(decoded.view->raw, raw);
}

TEST(value_decoder, invalid_base64_is_decode_error) {
  auto decoded = pledge::query::decode_value("%%%");
  EXPECT_FALSE(decoded.view.has_value());
  ASSERT_TRUE(decoded.error.has_value());
  EXPECT_EQ(decoded.error->code, error_code::decode);
}
