#pragma once

#include <pledge/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace pledge::common {

/// Parse a due date into Unix seconds (UTC).
///
/// Accepts `YYYY-MM-DD` (midnight UTC) or RFC 3339
/// `YYYY-MM-DDTHH:MM:SS[.frac](Z|+hh:mm|-hh:mm)`. Fractional seconds are
/// truncated. Returns nullopt for empty or malformed input.
std::optional<pledge::schema::timestamp_seconds_t> parse_timestamp(
    std::string_view input);

}  // namespace pledge::common
