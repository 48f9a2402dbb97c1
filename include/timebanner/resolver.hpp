/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef RESOLVER_HPP
#define RESOLVER_HPP

#include "timebanner/abbreviation_table.hpp"
#include "timebanner/absolute.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace timebanner {

// how the renderer should present a resolved instant
enum class display_intent { relative, absolute, clock };

const char *to_string(display_intent intent);

struct resolved_instant {
  instant_t instant;
  // offset the expression was written in, zero for UTC and relative times
  std::chrono::seconds source_offset{0};
  std::string zone_label;
  display_intent intent;
};

struct resolver_config {
  date_order order = date_order::ymd;
  bool strict = false;
};

/**
 * State built once at startup and handed to every request. The table is
 * never modified after construction, so any number of requests may share it.
 */
struct resolver_context {
  const abbreviation_table &table;
  resolver_config config;
};

/**
 * Turn a temporal expression into an instant.
 *
 *  - "+3600", "-1h30m": relative to now, as plain seconds or a duration.
 *  - "1700000000": Unix epoch seconds.
 *  - anything else: an absolute date-time, see parse_absolute.
 *
 * Throws parse_error. Nothing here reads the clock, "now" is only used for
 * relative expressions.
 */
resolved_instant resolve(std::string_view raw, const resolver_context &context, instant_t now);

// the current instant, for clock faces
resolved_instant resolve_clock(instant_t now);

} // namespace timebanner

#endif /* RESOLVER_HPP */
