#pragma once

#include <pledge/schema/client_error.hpp>
#include <pledge/schema/entity_alias.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace pledge::query {

inline constexpr auto kListPathPrefix = std::string_view{"/list/"};

struct path_result final {
  std::optional<std::string> path;
  std::optional<pledge::schema::client_error_t> error;
};

/// An explicit non-empty `path` always wins. Otherwise `alias` must name an
/// entity (promise, commitment, commiter, beneficiary) and resolves to
/// "/list/<alias>". Anything else is invalid_argument.
path_result resolve_query_path(std::string_view path, std::string_view alias);

/// abci_query expects `path` as a quoted string literal. Quoting follows Go's
/// strconv.Quote: C escapes for `\a` through `\v`, `\xNN` for other control
/// bytes, DEL and invalid UTF-8, `\uNNNN` for non-printable code points.
std::string quote_path(std::string_view path);

}  // namespace pledge::query
