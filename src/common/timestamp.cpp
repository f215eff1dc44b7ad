#include <pledge/common/timestamp.hpp>

#include <charconv>
#include <chrono>

namespace pledge::common {

namespace {

bool is_digit(const char c) { return c >= '0' && c <= '9'; }

// Fixed-width unsigned decimal field at input[offset, offset + width).
std::optional<int> read_field(const std::string_view input,
                              const size_t offset,
                              const size_t width) {
  if (input.size() < offset + width) {
    return std::nullopt;
  }
  for (auto i = offset; i < offset + width; ++i) {
    if (!is_digit(input[i])) {
      return std::nullopt;
    }
  }
  auto value = 0;
  auto* begin = input.data() + offset;
  auto [ptr, ec] = std::from_chars(begin, begin + width, value);
  if (ec != std::errc{} || ptr != begin + width) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::chrono::sys_days> read_date(const std::string_view input) {
  if (input.size() < 10 || input[4] != '-' || input[7] != '-') {
    return std::nullopt;
  }
  auto year = read_field(input, 0, 4);
  auto month = read_field(input, 5, 2);
  auto day = read_field(input, 8, 2);
  if (!year || !month || !day) {
    return std::nullopt;
  }
  auto date = std::chrono::year_month_day{
      std::chrono::year{*year}, std::chrono::month{static_cast<unsigned>(*month)},
      std::chrono::day{static_cast<unsigned>(*day)}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return std::chrono::sys_days{date};
}

// Zone designator: "Z", "z" or "+hh:mm" / "-hh:mm". Returns the offset east
// of UTC in seconds.
std::optional<int64_t> read_offset(const std::string_view zone) {
  if (zone == "Z" || zone == "z") {
    return 0;
  }
  if (zone.size() != 6 || (zone[0] != '+' && zone[0] != '-') ||
      zone[3] != ':') {
    return std::nullopt;
  }
  auto hours = read_field(zone, 1, 2);
  auto minutes = read_field(zone, 4, 2);
  if (!hours || !minutes || *hours > 23 || *minutes > 59) {
    return std::nullopt;
  }
  auto offset = int64_t{*hours} * 3600 + int64_t{*minutes} * 60;
  return zone[0] == '-' ? -offset : offset;
}

}  // namespace

std::optional<pledge::schema::timestamp_seconds_t> parse_timestamp(
    const std::string_view input) {
  auto date = read_date(input);
  if (!date) {
    return std::nullopt;
  }
  auto midnight = std::chrono::duration_cast<std::chrono::seconds>(
                      date->time_since_epoch())
                      .count();
  if (input.size() == 10) {
    return midnight;
  }

  if (input.size() < 20 || (input[10] != 'T' && input[10] != 't') ||
      input[13] != ':' || input[16] != ':') {
    return std::nullopt;
  }
  auto hour = read_field(input, 11, 2);
  auto minute = read_field(input, 14, 2);
  auto second = read_field(input, 17, 2);
  if (!hour || !minute || !second || *hour > 23 || *minute > 59 ||
      *second > 59) {
    return std::nullopt;
  }

  auto position = size_t{19};
  if (input[position] == '.') {
    ++position;
    auto fraction_start = position;
    while (position < input.size() && is_digit(input[position])) {
      ++position;
    }
    if (position == fraction_start) {
      return std::nullopt;
    }
  }

  auto offset = read_offset(input.substr(position));
  if (!offset) {
    return std::nullopt;
  }
  return midnight + int64_t{*hour} * 3600 + int64_t{*minute} * 60 +
         int64_t{*second} - *offset;
}

}  // namespace pledge::common
