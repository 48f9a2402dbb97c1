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

#include <chrono>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

using namespace std::chrono_literals;
using timebanner::parse_utc_offset;
using timebanner::parse_error;

TEST_CASE("Offsets with hours only", "[utc_offset]") {
  CHECK(parse_utc_offset("+09") == 9h);
  CHECK(parse_utc_offset("-5") == -5h);
  CHECK(parse_utc_offset("00") == 0s);
}

TEST_CASE("Offsets with minutes", "[utc_offset]") {
  CHECK(parse_utc_offset("+05:30") == 5h + 30min);
  CHECK(parse_utc_offset("+12:45") == 12h + 45min);
  CHECK(parse_utc_offset("-09:30") == -(9h + 30min));
  CHECK(parse_utc_offset("-03:30") == -3h - 30min);
}

TEST_CASE("Unicode minus sign", "[utc_offset]") {
  CHECK(parse_utc_offset("\xE2\x88\x92" "06") == -6h);
  CHECK(parse_utc_offset("\xE2\x88\x92" "02:30") == -(2h + 30min));
}

TEST_CASE("Plus-minus sign means no fixed offset", "[utc_offset]") {
  CHECK(parse_utc_offset("\xC2\xB1" "00") == 0s);
  CHECK(parse_utc_offset("\xC2\xB1" "12") == 0s);
}

TEST_CASE("Malformed offsets", "[utc_offset]") {
  CHECK_THROWS_AS(parse_utc_offset(""), parse_error);
  CHECK_THROWS_AS(parse_utc_offset("+"), parse_error);
  CHECK_THROWS_AS(parse_utc_offset("+123"), parse_error);
  CHECK_THROWS_AS(parse_utc_offset("+05:3"), parse_error);
  CHECK_THROWS_AS(parse_utc_offset("+05:300"), parse_error);
  CHECK_THROWS_AS(parse_utc_offset("+ab"), parse_error);
  CHECK_THROWS_AS(parse_utc_offset("+05:xx"), parse_error);
}

TEST_CASE("Offsets out of range", "[utc_offset]") {
  try {
    parse_utc_offset("+24");
    FAIL("Expected an exception");
  } catch (const parse_error &e) {
    CHECK(e.error_kind() == parse_error::kind::out_of_range);
  }

  CHECK_THROWS_AS(parse_utc_offset("+05:60"), parse_error);
}

TEST_CASE("Formatting offsets", "[utc_offset]") {
  CHECK(timebanner::format_utc_offset(0s) == "+00:00");
  CHECK(timebanner::format_utc_offset(5h + 30min) == "+05:30");
  CHECK(timebanner::format_utc_offset(-(3h + 30min)) == "-03:30");
}
