#pragma once

#include <pledge/schema/enum_string.hpp>
#include <pledge/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

// Schema type: query view.
// Unified presentation of a query value whatever its payload turned out to
// be: structured JSON, printable text, or binary re-encoded as base64.
namespace pledge::schema {

enum class view_kind : uint8_t {
  empty = 0,
  json = 1,
  text = 2,
  base64 = 3,
};

inline constexpr auto kViewKindNames =
    std::array<std::pair<std::string_view, view_kind>, 4>{{
        {"empty", view_kind::empty},
        {"json", view_kind::json},
        {"text", view_kind::text},
        {"base64", view_kind::base64},
    }};

template <uint16_t Version>
struct query_view;

template <>
struct query_view<1> final {
  view_kind kind{view_kind::empty};
  bytes_t raw;       // decoded value bytes
  std::string text;  // rendering for output, empty for an empty value
};

using query_view_t = query_view<1>;

}  // namespace pledge::schema
