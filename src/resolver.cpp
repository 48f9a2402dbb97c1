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
#include "timebanner/util.hpp"

#include <charconv>
#include <cstdint>
#include <optional>

#include <fmt/core.h>

namespace timebanner {

namespace {

using std::chrono::milliseconds;

// representable instants, matching the range of std::chrono::year
const instant_t earliest{std::chrono::sys_days{std::chrono::year::min() / 1 / 1}};
const instant_t latest{std::chrono::sys_days{std::chrono::year::max() / 12 / 31} +
                       std::chrono::days{1} - milliseconds{1}};

instant_t checked_instant(std::int64_t base_ms, std::int64_t delta_ms, std::string_view raw) {
  const auto total = add_int64(base_ms, delta_ms);
  if (!total)
    throw parse_error(fmt::format("Time '{}' is out of range", raw),
                      parse_error::kind::out_of_range);

  const instant_t result{milliseconds{*total}};
  if (result < earliest || result > latest)
    throw parse_error(fmt::format("Time '{}' is out of range", raw),
                      parse_error::kind::out_of_range);
  return result;
}

std::int64_t seconds_to_ms(std::int64_t seconds, std::string_view raw) {
  const auto result = multiply_int64(seconds, 1000);
  if (!result)
    throw parse_error(fmt::format("Time '{}' is out of range", raw),
                      parse_error::kind::out_of_range);
  return *result;
}

// "+123" or "-123" as whole seconds
std::optional<std::int64_t> signed_seconds(std::string_view raw) {
  const auto digits = raw.substr(1);
  if (!all_digits(digits))
    return {};

  std::int64_t value{};
  auto [_, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc())
    throw parse_error(fmt::format("Time '{}' is out of range", raw),
                      parse_error::kind::out_of_range);

  return raw.front() == '-' ? -value : value;
}

resolved_instant resolve_relative(std::string_view raw, instant_t now) {
  std::int64_t delta{};

  if (auto seconds = signed_seconds(raw)) {
    delta = seconds_to_ms(*seconds, raw);
  } else {
    try {
      delta = parse_duration(raw).count();
    } catch (const parse_error &e) {
      throw parse_error(fmt::format("Could not parse relative time '{}': {}", raw, e.what()),
                        e.error_kind());
    }
  }

  return resolved_instant{checked_instant(now.time_since_epoch().count(), delta, raw),
                          std::chrono::seconds{0}, {}, display_intent::relative};
}

resolved_instant resolve_epoch(std::string_view raw) {
  std::int64_t seconds{};
  auto [_, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), seconds);
  if (ec != std::errc())
    throw parse_error(fmt::format("Invalid timestamp '{}'", raw),
                      parse_error::kind::out_of_range);

  return resolved_instant{checked_instant(0, seconds_to_ms(seconds, raw), raw),
                          std::chrono::seconds{0}, {}, display_intent::absolute};
}

} // anonymous namespace

const char *to_string(display_intent intent) {
  switch (intent) {
  case display_intent::relative: return "relative";
  case display_intent::absolute: return "absolute";
  case display_intent::clock:    return "clock";
  }
  return "unknown";
}

resolved_instant resolve(std::string_view raw, const resolver_context &context, instant_t now) {

  if (raw.starts_with('+') || raw.starts_with('-'))
    return resolve_relative(raw, now);

  if (all_digits(raw))
    return resolve_epoch(raw);

  auto fields = parse_absolute(raw, context.table, context.config.order, context.config.strict);
  const auto instant = checked_instant(to_instant(fields).time_since_epoch().count(), 0, raw);

  return resolved_instant{instant, fields.offset, std::move(fields.zone_label),
                          display_intent::absolute};
}

resolved_instant resolve_clock(instant_t now) {
  return resolved_instant{now, std::chrono::seconds{0}, {}, display_intent::clock};
}

} // namespace timebanner
