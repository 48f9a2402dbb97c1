/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/absolute.hpp"
#include "timebanner/parse_error.hpp"
#include "timebanner/utc_offset.hpp"
#include "timebanner/util.hpp"

#include <charconv>
#include <span>
#include <vector>

#include <fmt/core.h>

namespace timebanner {

namespace {

constexpr std::string_view separators = " -.,:";

constexpr std::size_t date_segments = 3;
constexpr std::size_t max_time_segments = 4;  // hour, minute, second, fraction

constexpr int min_year = -32767;
constexpr int max_year = 32767;

int to_field(std::string_view segment, std::string_view name, std::string_view input) {
  if (!all_digits(segment))
    throw parse_error(fmt::format("Could not parse {} from '{}' in '{}', expected digits",
                                  name, segment, input));

  int value{};
  auto [_, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), value);
  if (ec != std::errc())
    throw parse_error(fmt::format("Could not parse {} from '{}' in '{}' (number too large)",
                                  name, segment, input),
                      parse_error::kind::out_of_range);
  return value;
}

std::vector<std::string_view> tokenize(std::string_view input) {
  std::vector<std::string_view> segments;
  std::size_t start = 0;

  while (true) {
    auto end = input.find_first_of(separators, start);
    auto segment = input.substr(start, end == std::string_view::npos ? end : end - start);

    if (segment.empty())
      throw parse_error(fmt::format("Empty segment at position {} in '{}'", start, input));

    segments.push_back(segment);

    if (end == std::string_view::npos)
      break;
    start = end + 1;
  }

  return segments;
}

const abbreviation_table::entry &lookup_zone(std::string_view abbr,
                                             const abbreviation_table &table,
                                             bool strict) {
  const auto &zone = table.lookup(abbr);

  if (strict && zone.ambiguous) {
    throw parse_error(
        fmt::format("Timezone abbreviation '{}' is ambiguous (it would be read as {}, UTC{})",
                    abbr, zone.label, format_utc_offset(zone.offset)),
        parse_error::kind::ambiguous);
  }
  return zone;
}

bool looks_like_rfc3339(std::string_view input) {
  return input.size() > 11 && input[10] == 'T' &&
         is_ascii_digit(input[9]) && is_ascii_digit(input[11]);
}

// YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM)
absolute_fields parse_rfc3339(std::string_view input) {

  const auto malformed = [input]() {
    return parse_error(fmt::format(
        "Could not parse '{}' as RFC 3339, expected YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM)", input));
  };

  if (input.size() < 20 || input[4] != '-' || input[7] != '-' ||
      input[13] != ':' || input[16] != ':')
    throw malformed();

  absolute_fields fields;
  fields.year = to_field(input.substr(0, 4), "year", input);
  fields.month = to_field(input.substr(5, 2), "month", input);
  fields.day = to_field(input.substr(8, 2), "day", input);
  fields.hour = to_field(input.substr(11, 2), "hour", input);
  fields.minute = to_field(input.substr(14, 2), "minute", input);
  fields.second = to_field(input.substr(17, 2), "second", input);

  auto zone = input.substr(19);

  if (zone.starts_with('.')) {
    std::size_t digits = 1;
    while (digits < zone.size() && is_ascii_digit(zone[digits]))
      ++digits;
    if (digits == 1)
      throw malformed();
    zone.remove_prefix(digits);
  }

  if (zone == "Z" || zone == "z")
    return fields;

  if (zone.size() != 6 || (zone[0] != '+' && zone[0] != '-'))
    throw malformed();

  fields.offset = parse_utc_offset(zone);
  return fields;
}

} // anonymous namespace

std::optional<date_order> date_order_from_string(std::string_view name) {
  if (iequals(name, "ymd"))
    return date_order::ymd;
  if (iequals(name, "mdy"))
    return date_order::mdy;
  if (iequals(name, "dmy"))
    return date_order::dmy;
  return {};
}

const char *to_string(date_order order) {
  switch (order) {
  case date_order::ymd: return "ymd";
  case date_order::mdy: return "mdy";
  case date_order::dmy: return "dmy";
  }
  return "unknown";
}

absolute_fields parse_absolute(std::string_view input,
                               const abbreviation_table &table,
                               date_order order,
                               bool strict) {

  input = trim(input);

  if (input.empty())
    throw parse_error("Empty date, expected <date> [time] [timezone abbreviation]");

  if (looks_like_rfc3339(input))
    return parse_rfc3339(input);

  auto segments = tokenize(input);

  absolute_fields fields;

  // a trailing alphabetic segment is the timezone
  if (segments.size() > 1 && all_alpha(segments.back())) {
    const auto abbr = segments.back();
    if (abbr.size() < 2 || abbr.size() > 5)
      throw parse_error(fmt::format("Invalid timezone abbreviation '{}' in '{}', expected 2-5 letters",
                                    abbr, input));

    const auto &zone = lookup_zone(abbr, table, strict);
    fields.offset = zone.offset;
    fields.zone_label = zone.abbreviation;
    segments.pop_back();
  }

  if (segments.size() < date_segments)
    throw parse_error(fmt::format("Could not parse date from '{}', expected three date segments "
                                  "separated by any of \"{}\"", input, separators));

  if (segments.size() > date_segments + max_time_segments)
    throw parse_error(fmt::format("Could not parse time from '{}': too many segments, expected at "
                                  "most hour, minute, second and fraction", input));

  const int first = to_field(segments[0], "date", input);
  const int second = to_field(segments[1], "date", input);
  const int third = to_field(segments[2], "date", input);

  switch (order) {
  case date_order::ymd:
    fields.year = first; fields.month = second; fields.day = third;
    break;
  case date_order::mdy:
    fields.month = first; fields.day = second; fields.year = third;
    break;
  case date_order::dmy:
    fields.day = first; fields.month = second; fields.year = third;
    break;
  }

  const auto time = std::span(segments).subspan(date_segments);

  if (time.size() > 0)
    fields.hour = to_field(time[0], "hour", input);
  if (time.size() > 1)
    fields.minute = to_field(time[1], "minute", input);
  if (time.size() > 2)
    fields.second = to_field(time[2], "second", input);
  // fraction of a second: checked, then dropped
  if (time.size() > 3)
    to_field(time[3], "fraction of a second", input);

  return fields;
}

instant_t to_instant(const absolute_fields &fields) {
  using namespace std::chrono;

  if (fields.year < min_year || fields.year > max_year)
    throw parse_error(fmt::format("Year {} is out of range", fields.year),
                      parse_error::kind::out_of_range);

  if (fields.month < 1 || fields.month > 12)
    throw parse_error(fmt::format("Month {} is out of range, expected 1-12", fields.month),
                      parse_error::kind::out_of_range);

  const auto invalid_date = [&fields]() {
    return parse_error(fmt::format("Invalid date {:04d}-{:02d}-{:02d}",
                                   fields.year, fields.month, fields.day),
                       parse_error::kind::out_of_range);
  };

  if (fields.day < 1 || fields.day > 31)
    throw invalid_date();

  const year_month_day date{year{fields.year},
                            month{static_cast<unsigned>(fields.month)},
                            day{static_cast<unsigned>(fields.day)}};
  if (!date.ok())
    throw invalid_date();

  if (fields.hour > 23 || fields.minute > 59 || fields.second > 59)
    throw parse_error(fmt::format("Invalid time {:02d}:{:02d}:{:02d}",
                                  fields.hour, fields.minute, fields.second),
                      parse_error::kind::out_of_range);

  const auto local = sys_days{date} + hours{fields.hour} + minutes{fields.minute} +
                     seconds{fields.second};

  return time_point_cast<milliseconds>(local - fields.offset);
}

} // namespace timebanner
