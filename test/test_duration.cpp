/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/duration.hpp"
#include "timebanner/parse_error.hpp"

#include <chrono>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

using namespace std::chrono;
using namespace std::chrono_literals;
using timebanner::parse_duration;
using timebanner::parse_error;

namespace {

constexpr milliseconds year_length = days{365} + timebanner::leap_compensation;

parse_error::kind error_kind_of(std::string_view input) {
  try {
    parse_duration(input);
  } catch (const parse_error &e) {
    return e.error_kind();
  }
  FAIL("Expected a parse_error for '" << std::string(input) << "'");
  return parse_error::kind::malformed;
}

} // anonymous namespace

TEST_CASE("Empty duration is zero", "[duration]") {
  CHECK(parse_duration("") == 0ms);
  CHECK(parse_duration("   ") == 0ms);
}

TEST_CASE("Single units", "[duration]") {
  CHECK(parse_duration("1s") == 1s);
  CHECK(parse_duration("90 seconds") == 90s);
  CHECK(parse_duration("5m") == 5min);
  CHECK(parse_duration("5 mins") == 5min);
  CHECK(parse_duration("2h") == 2h);
  CHECK(parse_duration("2 hrs") == 2h);
  CHECK(parse_duration("3d") == days{3});
  CHECK(parse_duration("1 week") == weeks{1});
  CHECK(parse_duration("2wk") == weeks{2});
  CHECK(parse_duration("1mon") == timebanner::average_month);
  CHECK(parse_duration("1 month") == timebanner::average_month);
}

TEST_CASE("A month is an average Gregorian month", "[duration]") {
  CHECK(timebanner::average_month == 2'629'800'000ms);
  CHECK(parse_duration("12 months") == duration_cast<milliseconds>(days{365}) + 6h);
}

TEST_CASE("Years include leap compensation", "[duration]") {
  CHECK(parse_duration("1y") == year_length);
  CHECK(parse_duration("4 years") == 4 * year_length);
  CHECK(parse_duration("0y") == 0ms);
}

TEST_CASE("Composite durations", "[duration]") {
  CHECK(parse_duration("1 year 2 months 3 days") ==
        year_length + 2 * timebanner::average_month + days{3});
  CHECK(parse_duration("3h30m") == 3h + 30min);
  CHECK(parse_duration("1d 2h 3m 4s") == days{1} + 2h + 3min + 4s);
  CHECK(parse_duration("1w1d") == days{8});
}

TEST_CASE("Sign applies to the whole duration", "[duration]") {
  CHECK(parse_duration("+1d") == days{1});
  CHECK(parse_duration("-14mon") == -14 * timebanner::average_month);
  CHECK(parse_duration("-1d 12h") == -(days{1} + 12h));
  // leap compensation goes in before the sign
  CHECK(parse_duration("-1y") == -year_length);
}

TEST_CASE("Units out of order", "[duration]") {
  CHECK(error_kind_of("1d2y") == parse_error::kind::malformed);
  CHECK(error_kind_of("30m 1h") == parse_error::kind::malformed);
  CHECK(error_kind_of("1d1d") == parse_error::kind::malformed);
}

TEST_CASE("Malformed durations", "[duration]") {
  CHECK(error_kind_of("+") == parse_error::kind::malformed);
  CHECK(error_kind_of("10") == parse_error::kind::malformed);
  CHECK(error_kind_of("10x") == parse_error::kind::malformed);
  CHECK(error_kind_of("1d garbage") == parse_error::kind::malformed);
  CHECK(error_kind_of("1D") == parse_error::kind::malformed);
  CHECK(error_kind_of("1  d") == parse_error::kind::malformed);
  CHECK(error_kind_of("--1d") == parse_error::kind::malformed);

  CHECK_THROWS_WITH(parse_duration("1d2y"), Catch::Contains("position 2"));
}

TEST_CASE("Durations out of range", "[duration]") {
  CHECK(error_kind_of("99999999999999999999y") == parse_error::kind::out_of_range);
  CHECK(error_kind_of("9999999999999999s") == parse_error::kind::out_of_range);
  CHECK(error_kind_of("2000000000000h 9000000000000000s") == parse_error::kind::out_of_range);
}
