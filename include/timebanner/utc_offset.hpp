/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef UTC_OFFSET_HPP
#define UTC_OFFSET_HPP

#include <chrono>
#include <string>
#include <string_view>

namespace timebanner {

/**
 * Parse a UTC offset token of the form "[sign]HH[:MM]" into signed seconds,
 * negative meaning west of Greenwich.
 *
 * The sign may be '+', '-', U+2212 MINUS SIGN or '±'. A '±' marks a variable
 * offset in the reference data and always yields zero, whatever digits follow.
 * A missing sign is treated as '+'. Hours must be 0-23 (one or two digits) and
 * minutes, if present, two digits in 0-59.
 *
 * Throws parse_error if the token doesn't have this shape or a field is out
 * of range.
 */
std::chrono::seconds parse_utc_offset(std::string_view token);

/**
 * Format an offset as "+HH:MM" / "-HH:MM", as used in RFC 3339.
 */
std::string format_utc_offset(std::chrono::seconds offset);

} // namespace timebanner

#endif /* UTC_OFFSET_HPP */
