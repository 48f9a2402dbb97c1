/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/utc_offset.hpp"
#include "timebanner/parse_error.hpp"
#include "timebanner/util.hpp"

#include <charconv>
#include <cstdlib>

#include <fmt/core.h>

namespace timebanner {

namespace {

constexpr std::string_view minus_sign = "\xE2\x88\x92";   // U+2212
constexpr std::string_view plus_minus_sign = "\xC2\xB1";  // U+00B1

int to_int(std::string_view s) {
  int value{};
  auto [_, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc())
    throw parse_error(fmt::format("Could not parse '{}' as a number", s));
  return value;
}

} // anonymous namespace

std::chrono::seconds parse_utc_offset(std::string_view token) {

  std::string_view rest = token;
  int sign = 1;
  bool variable = false;

  if (rest.starts_with(plus_minus_sign)) {
    variable = true;
    rest.remove_prefix(plus_minus_sign.size());
  } else if (rest.starts_with(minus_sign)) {
    sign = -1;
    rest.remove_prefix(minus_sign.size());
  } else if (rest.starts_with('-')) {
    sign = -1;
    rest.remove_prefix(1);
  } else if (rest.starts_with('+')) {
    rest.remove_prefix(1);
  }

  std::string_view hours = rest;
  std::string_view minutes;

  if (auto colon = rest.find(':'); colon != std::string_view::npos) {
    hours = rest.substr(0, colon);
    minutes = rest.substr(colon + 1);
    if (minutes.size() != 2 || !all_digits(minutes))
      throw parse_error(fmt::format("Invalid UTC offset '{}', expected [+-]HH:MM", token));
  }

  if (hours.empty() || hours.size() > 2 || !all_digits(hours))
    throw parse_error(fmt::format("Invalid UTC offset '{}', expected [+-]HH[:MM]", token));

  // placeholder for zones without a fixed offset
  if (variable)
    return std::chrono::seconds{0};

  const int h = to_int(hours);
  const int m = minutes.empty() ? 0 : to_int(minutes);

  if (h > 23)
    throw parse_error(fmt::format("Hours out of range in UTC offset '{}'", token),
                      parse_error::kind::out_of_range);
  if (m > 59)
    throw parse_error(fmt::format("Minutes out of range in UTC offset '{}'", token),
                      parse_error::kind::out_of_range);

  return std::chrono::hours{h * sign} + std::chrono::minutes{m * sign};
}

std::string format_utc_offset(std::chrono::seconds offset) {
  const auto total = offset.count();
  const auto magnitude = std::abs(total);
  return fmt::format("{}{:02d}:{:02d}", total < 0 ? '-' : '+',
                     magnitude / 3600, (magnitude % 3600) / 60);
}

} // namespace timebanner
