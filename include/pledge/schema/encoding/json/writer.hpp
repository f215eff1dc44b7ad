#pragma once
#include <json/json.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pledge::schema::encoding::json {

/// Quote `text` as a JSON string the way the node's encoding/json does: `<`,
/// `>` and `&` become \u003c, \u003e and \u0026, U+2028 and U+2029 are
/// escaped, and invalid UTF-8 is replaced with U+FFFD.
std::string quote(std::string_view text);

/// Streaming JSON writer that emits members in the order they are written.
///
/// With an empty indent the output is compact. Otherwise it matches
/// MarshalIndent: one member or element per line, `": "` after keys, and
/// `{}` or `[]` for empty containers.
class writer final {
 public:
  explicit writer(std::string_view indent = {});

  writer& begin_object();
  writer& end_object();
  writer& begin_array();
  writer& end_array();

  writer& key(std::string_view name);

  writer& string(std::string_view value);
  writer& integer(int64_t value);
  writer& unsigned_integer(uint64_t value);
  writer& real(double value);
  writer& boolean(bool value);
  writer& null();

  /// Write a parsed document; object members come out in byte-wise key order.
  writer& value(const Json::Value& document);

  std::string release();

 private:
  void open(char bracket);
  void close(char bracket);
  void separate();
  void newline();

  std::string indent_;
  std::string out_;
  // Members or elements written so far, per open container.
  std::vector<std::size_t> stack_;
  bool after_key_{};
};

}  // namespace pledge::schema::encoding::json
