/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/resolver.hpp"
#include "timebanner/duration.hpp"
#include "timebanner/parse_error.hpp"

#include <chrono>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

using namespace std::chrono;
using namespace std::chrono_literals;
using namespace timebanner;

namespace {

const abbreviation_table &table() {
  static const auto t = abbreviation_table::from_file(TEST_ABBREVIATIONS_FILE);
  return t;
}

const instant_t now{sys_days{2024y / January / 1} + 12h};

resolved_instant resolve_default(std::string_view raw, instant_t at = now) {
  const resolver_context ctx{table(), resolver_config{}};
  return resolve(raw, ctx, at);
}

parse_error::kind error_kind_of(std::string_view raw, resolver_config config = {}) {
  const resolver_context ctx{table(), config};
  try {
    resolve(raw, ctx, now);
  } catch (const parse_error &e) {
    return e.error_kind();
  }
  FAIL("Expected a parse_error for '" << std::string(raw) << "'");
  return parse_error::kind::malformed;
}

} // anonymous namespace

TEST_CASE("Signed seconds are relative to now", "[resolver]") {
  const auto later = resolve_default("+3600");
  CHECK(later.instant == now + 1h);
  CHECK(later.intent == display_intent::relative);
  CHECK(later.source_offset == 0s);
  CHECK(later.zone_label.empty());

  CHECK(resolve_default("-90").instant == now - 90s);
  CHECK(resolve_default("+0").instant == now);
}

TEST_CASE("Signed durations are relative to now", "[resolver]") {
  CHECK(resolve_default("+1 day").instant == now + days{1});
  CHECK(resolve_default("-2h30m").instant == now - 2h - 30min);
  CHECK(resolve_default("-1y").instant == now - days{365} - leap_compensation);
  CHECK(resolve_default("+1 day").intent == display_intent::relative);
}

TEST_CASE("Unsigned integers are epoch seconds", "[resolver]") {
  const auto result = resolve_default("1700000000");
  CHECK(result.instant == instant_t{1'700'000'000s});
  CHECK(result.intent == display_intent::absolute);

  // no dependency on the current time
  CHECK(resolve_default("1700000000", instant_t{}).instant == result.instant);

  CHECK(resolve_default("0").instant == instant_t{});
}

TEST_CASE("Everything else is an absolute time", "[resolver]") {
  const auto result = resolve_default("2023-06-14 15:45:30 JST");
  CHECK(result.instant == instant_t{sys_days{2023y / June / 14} + 6h + 45min + 30s});
  CHECK(result.source_offset == 9h);
  CHECK(result.zone_label == "JST");
  CHECK(result.intent == display_intent::absolute);
}

TEST_CASE("Date order comes from the configuration", "[resolver]") {
  const resolver_context ctx{table(), resolver_config{date_order::dmy, false}};
  CHECK(resolve("14-06-2023", ctx, now).instant == instant_t{sys_days{2023y / June / 14}});
  CHECK(error_kind_of("14-06-2023") == parse_error::kind::out_of_range);
}

TEST_CASE("Strict mode comes from the configuration", "[resolver]") {
  CHECK(error_kind_of("2023-06-14 CST", resolver_config{date_order::ymd, true}) ==
        parse_error::kind::ambiguous);
  CHECK(resolve_default("2023-06-14 CST").source_offset == -6h);
}

TEST_CASE("Resolution failures", "[resolver]") {
  CHECK(error_kind_of("") == parse_error::kind::malformed);
  CHECK(error_kind_of("-") == parse_error::kind::malformed);
  CHECK(error_kind_of("+1d2y") == parse_error::kind::malformed);
  CHECK(error_kind_of("tomorrow") == parse_error::kind::malformed);
  CHECK(error_kind_of("2023-06-14 XYZT") == parse_error::kind::not_found);

  const resolver_context ctx{table(), resolver_config{}};
  CHECK_THROWS_WITH(resolve("+1d2y", ctx, now),
                    Catch::StartsWith("Could not parse relative time '+1d2y'"));
}

TEST_CASE("Results outside the representable range", "[resolver]") {
  CHECK(error_kind_of("99999999999999999999") == parse_error::kind::out_of_range);
  CHECK(error_kind_of("99999999999999") == parse_error::kind::out_of_range);
  CHECK(error_kind_of("+99999999999999") == parse_error::kind::out_of_range);
  CHECK(error_kind_of("-99999999999999999999") == parse_error::kind::out_of_range);
  CHECK(error_kind_of("+99999999999999999y") == parse_error::kind::out_of_range);

  // year 10000 is still fine
  CHECK(resolve_default("253402300800").instant == instant_t{sys_days{10000y / January / 1}});
}

TEST_CASE("Clock is always now", "[resolver]") {
  const auto result = resolve_clock(now);
  CHECK(result.instant == now);
  CHECK(result.intent == display_intent::clock);
  CHECK(std::string(to_string(result.intent)) == "clock");
}
