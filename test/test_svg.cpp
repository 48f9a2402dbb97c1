/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/svg.hpp"

#include "test_request.hpp"

#include <chrono>
#include <string>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

using namespace std::chrono;
using namespace std::chrono_literals;
using namespace timebanner;

namespace {

const instant_t now{sys_days{2024y / January / 1}};

std::string banner(const std::string &text) {
  string_buffer out;
  write_banner(out, text);
  return out.str();
}

std::string svg_for(const resolved_instant &resolved) {
  string_buffer out;
  write_svg(out, resolved, now);
  return out.str();
}

} // anonymous namespace

TEST_CASE("Relative text", "[svg]") {
  CHECK(relative_text(now, now) == "now");
  CHECK(relative_text(now + 500ms, now) == "now");
  CHECK(relative_text(now + 1s, now) == "in 1 second");
  CHECK(relative_text(now - 2h, now) == "2 hours ago");
  CHECK(relative_text(now - 2h - 59min, now) == "2 hours ago");
  CHECK(relative_text(now + days{1}, now) == "in 1 day");
  CHECK(relative_text(now + days{14}, now) == "in 2 weeks");
  CHECK(relative_text(now + days{45}, now) == "in 1 month");
  CHECK(relative_text(now - days{800}, now) == "2 years ago");
}

TEST_CASE("Absolute text", "[svg]") {
  const instant_t instant{1'700'000'000s};
  CHECK(absolute_text(instant, 0s) == "2023-11-14T22:13:20+00:00");
  CHECK(absolute_text(instant, -6h, "CST") == "2023-11-14T16:13:20-06:00 CST");
  CHECK(absolute_text(instant, 5h + 30min) == "2023-11-15T03:43:20+05:30");
  CHECK(absolute_text(instant_t{-1s}, 0s) == "1969-12-31T23:59:59+00:00");
}

TEST_CASE("Banner escapes its text", "[svg]") {
  const auto svg = banner("a<b & \"c\"");
  CHECK_THAT(svg, Catch::StartsWith("<?xml version=\"1.0\" encoding=\"UTF-8\"?>"));
  CHECK_THAT(svg, Catch::Contains("<svg "));
  // in the aria-label attribute
  CHECK_THAT(svg, Catch::Contains("a&lt;b &amp; &quot;c&quot;"));
  // in the text and title elements
  CHECK_THAT(svg, Catch::Contains("<title>a&lt;b &amp; "));
  CHECK_THAT(svg, Catch::Contains("fill=\"#f6f8fa\">a&lt;b &amp; "));
  CHECK_THAT(svg, !Catch::Contains("a<b"));
}

TEST_CASE("Banner width follows the text", "[svg]") {
  CHECK_THAT(banner("now"), Catch::Contains("width=\"81\""));
  CHECK_THAT(banner("in 3 days"), Catch::Contains("viewBox=\"0 0 147 40\""));
  // multi-byte characters are one glyph each
  CHECK_THAT(banner("n\xc3\xb6w"), Catch::Contains("width=\"81\""));
}

TEST_CASE("Banner leaves the buffer open", "[svg]") {
  string_buffer out;
  write_banner(out, "now");
  CHECK_FALSE(out.closed());
  CHECK_THAT(out.str(), Catch::EndsWith("</svg>\n"));
}

TEST_CASE("Clock face", "[svg]") {
  const instant_t instant{sys_days{2024y / January / 1} + 3h};
  string_buffer out;
  write_clock(out, instant);
  const auto &svg = out.str();

  CHECK_THAT(svg, Catch::Contains("<svg "));
  CHECK_THAT(svg, Catch::Contains("<circle"));
  // hour hand at three o'clock, minute and second hands at twelve
  CHECK_THAT(svg, Catch::Contains("rotate(90.00 32 32)"));
  CHECK_THAT(svg, Catch::Contains("rotate(0.00 32 32)"));
  CHECK_THAT(svg, Catch::Contains("2024-01-01T03:00:00+00:00"));
}

TEST_CASE("Rendering follows the display intent", "[svg]") {
  const resolved_instant clock{now, 0s, {}, display_intent::clock};
  CHECK_THAT(svg_for(clock), Catch::Contains("<circle"));

  const resolved_instant relative{now + 1h, 0s, {}, display_intent::relative};
  CHECK_THAT(svg_for(relative), Catch::Contains("in 1 hour"));

  const resolved_instant absolute{instant_t{1'700'000'000s}, 0s, {}, display_intent::absolute};
  CHECK_THAT(svg_for(absolute), Catch::Contains("2023-11-14T22:13:20+00:00"));
}
