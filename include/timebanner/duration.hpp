/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef DURATION_HPP
#define DURATION_HPP

#include <chrono>
#include <string_view>

namespace timebanner {

// fixed calendar approximations used for relative durations
constexpr std::chrono::milliseconds average_month{2'629'800'000};  // 365.25 / 12 days
constexpr std::chrono::hours leap_compensation{6};                  // per positive year

/**
 * Parse a relative duration such as "1y2mon3w4d5h6m7s", "+3h 30m" or
 * "-1week".
 *
 * Units must appear in descending order (years, months, weeks, days, hours,
 * minutes, seconds) and each at most once. A leading '+' or '-' applies to
 * the total, after all units have been added up. Empty or whitespace-only
 * input is a zero duration.
 *
 * A year is 365 days plus 6 hours of leap compensation when the count is
 * positive, and a month is 30.4375 days.
 *
 * Throws parse_error on anything else.
 */
std::chrono::milliseconds parse_duration(std::string_view input);

} // namespace timebanner

#endif /* DURATION_HPP */
