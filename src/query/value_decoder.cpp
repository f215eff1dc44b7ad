#include <pledge/query/value_decoder.hpp>
#include <pledge/schema/encoding/json/primitives.hpp>

#include <algorithm>

namespace pledge::query {

using pledge::schema::error_code;
using pledge::schema::make_error;
using pledge::schema::query_view_t;
using pledge::schema::view_kind;

decode_result decode_value(const std::string_view value_b64) {
  if (value_b64.empty()) {
    return decode_result{.view = query_view_t{}};
  }

  auto raw = pledge::schema::try_from_base64(value_b64);
  if (!raw) {
    return decode_result{.error = make_error(
                             error_code::decode,
                             "cannot base64-decode value")};
  }

  auto view = query_view_t{.kind = view_kind::text, .raw = std::move(*raw)};
  // JSON text never holds a raw NUL; the parser would stop at one and accept
  // the prefix.
  if (std::find(std::begin(view.raw), std::end(view.raw), 0) !=
      std::end(view.raw)) {
    view.kind = view_kind::base64;
    view.text = pledge::schema::to_base64(view.raw);
  } else if (auto document = pledge::schema::encoding::json::parse(
                 pledge::schema::make_string_view(view.raw))) {
    view.kind = view_kind::json;
    view.text = pledge::schema::encoding::json::write_pretty(*document);
  } else {
    view.text = pledge::schema::make_string(view.raw);
  }
  return decode_result{.view = std::move(view)};
}

}  // namespace pledge::query
