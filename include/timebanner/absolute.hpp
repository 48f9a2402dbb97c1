/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef ABSOLUTE_HPP
#define ABSOLUTE_HPP

#include "timebanner/abbreviation_table.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace timebanner {

using instant_t = std::chrono::sys_time<std::chrono::milliseconds>;

// order of the three leading date segments
enum class date_order { ymd, mdy, dmy };

std::optional<date_order> date_order_from_string(std::string_view name);
const char *to_string(date_order order);

// civil fields as written, before the offset is applied
struct absolute_fields {
  int year = 1970;
  int month = 1;
  int day = 1;
  int hour = 0;
  int minute = 0;
  int second = 0;
  std::chrono::seconds offset{0};
  // abbreviation the offset came from, empty for UTC or a numeric offset
  std::string zone_label;
};

/**
 * Parse a loosely formatted date-time such as "2023-06-14-3",
 * "2023.06.14.15-45-30,123-CST" or "14 06 2023 9:30 BST".
 *
 * Segments are separated by any of ' ', '-', '.', ',' and ':'. The first three
 * are the date in the given order, then up to three time segments (hour,
 * minute, second) and an optional fraction of a second, which is ignored. A
 * final alphabetic segment of 2-5 letters names a timezone abbreviation;
 * without one the time is UTC. With strict set, abbreviations which have
 * several meanings are refused.
 *
 * Input of the form YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM) is read as
 * RFC 3339 instead.
 *
 * Throws parse_error. Field ranges are checked by to_instant, not here.
 */
absolute_fields parse_absolute(std::string_view input,
                               const abbreviation_table &table,
                               date_order order = date_order::ymd,
                               bool strict = false);

/**
 * Convert civil fields to an instant on the UTC timeline, rejecting
 * impossible dates and times (2023-02-29, month 13, hour 24...).
 */
instant_t to_instant(const absolute_fields &fields);

} // namespace timebanner

#endif /* ABSOLUTE_HPP */
