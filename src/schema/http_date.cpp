#include <vcr/schema/enum_string.hpp>
#include <vcr/schema/http_date.hpp>

#include <charconv>
#include <chrono>
#include <cctype>
#include <initializer_list>

namespace vcr::schema {

namespace {

constexpr auto kMonthNames = enum_mappings_t<unsigned, 12>{{
    {"jan", 1},
    {"feb", 2},
    {"mar", 3},
    {"apr", 4},
    {"may", 5},
    {"jun", 6},
    {"jul", 7},
    {"aug", 8},
    {"sep", 9},
    {"oct", 10},
    {"nov", 11},
    {"dec", 12},
}};

struct cursor final {
  std::string_view rest;

  void skip_spaces() {
    while (!rest.empty() &&
           std::isspace(static_cast<unsigned char>(rest.front())) != 0) {
      rest.remove_prefix(1);
    }
  }

  std::string_view take_word() {
    skip_spaces();
    auto end = std::size_t{0};
    while (end < rest.size() &&
           std::isalpha(static_cast<unsigned char>(rest[end])) != 0) {
      ++end;
    }
    auto word = rest.substr(0, end);
    rest.remove_prefix(end);
    return word;
  }

  std::optional<int> take_number(const std::size_t min_digits,
                                 const std::size_t max_digits) {
    skip_spaces();
    // from_chars would also take a sign.
    if (rest.empty() ||
        std::isdigit(static_cast<unsigned char>(rest.front())) == 0) {
      return std::nullopt;
    }
    auto value = 0;
    auto [ptr, ec] =
        std::from_chars(rest.data(), rest.data() + rest.size(), value);
    auto digits = static_cast<std::size_t>(ptr - rest.data());
    if (ec != std::errc{} || digits < min_digits || digits > max_digits) {
      return std::nullopt;
    }
    rest.remove_prefix(digits);
    return value;
  }

  bool take(const char ch) {
    skip_spaces();
    if (rest.empty() || rest.front() != ch) {
      return false;
    }
    rest.remove_prefix(1);
    return true;
  }
};

// Offset east of UTC, in minutes.
std::optional<int> parse_zone(cursor& in) {
  in.skip_spaces();
  if (in.rest.empty()) {
    return std::nullopt;
  }
  auto sign = in.rest.front();
  if (sign == '+' || sign == '-') {
    in.rest.remove_prefix(1);
    if (in.rest.size() < 4 ||
        std::isdigit(static_cast<unsigned char>(in.rest.front())) == 0) {
      return std::nullopt;
    }
    auto hhmm = in.take_number(4, 4);
    if (!hhmm || (*hhmm % 100) >= 60) {
      return std::nullopt;
    }
    auto minutes = ((*hhmm / 100) * 60) + (*hhmm % 100);
    return sign == '-' ? -minutes : minutes;
  }
  auto zone = in.take_word();
  for (const auto name : {"GMT", "UT", "UTC", "Z"}) {
    if (zone == name) {
      return 0;
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<timestamp_milliseconds_t> try_parse_http_date(
    const std::string_view text) {
  auto in = cursor{text};

  in.skip_spaces();
  if (!in.rest.empty() &&
      std::isalpha(static_cast<unsigned char>(in.rest.front())) != 0) {
    in.take_word();
    if (!in.take(',')) {
      return std::nullopt;
    }
  }

  auto day = in.take_number(1, 2);
  auto month = from_string_icase(in.take_word(), kMonthNames);
  auto year = in.take_number(4, 4);
  if (!day || !month || !year) {
    return std::nullopt;
  }

  auto hour = in.take_number(2, 2);
  if (!hour || !in.take(':')) {
    return std::nullopt;
  }
  auto minute = in.take_number(2, 2);
  if (!minute) {
    return std::nullopt;
  }
  auto second = 0;
  if (in.take(':')) {
    auto parsed = in.take_number(2, 2);
    if (!parsed) {
      return std::nullopt;
    }
    second = *parsed;
  }
  auto offset_minutes = parse_zone(in);
  in.skip_spaces();
  if (!offset_minutes || !in.rest.empty()) {
    return std::nullopt;
  }
  // 60 admits a leap second.
  if (*hour > 23 || *minute > 59 || second > 60) {
    return std::nullopt;
  }

  auto date = std::chrono::year_month_day{
      std::chrono::year{*year}, std::chrono::month{*month},
      std::chrono::day{static_cast<unsigned>(*day)}};
  if (!date.ok()) {
    return std::nullopt;
  }

  auto point = std::chrono::sys_days{date} + std::chrono::hours{*hour} +
               std::chrono::minutes{*minute} + std::chrono::seconds{second} -
               std::chrono::minutes{*offset_minutes};
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    point.time_since_epoch())
                    .count();
  if (millis < 0) {
    return std::nullopt;
  }
  return static_cast<timestamp_milliseconds_t>(millis);
}

}  // namespace vcr::schema
