/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef SVG_HPP
#define SVG_HPP

#include "timebanner/output_buffer.hpp"
#include "timebanner/resolver.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace timebanner {

/**
 * Describe how far instant is from now in the largest whole unit, e.g.
 * "in 3 hours", "2 days ago" or "now" when under a second apart. Years are
 * 365 days and months 30 days here.
 */
std::string relative_text(instant_t instant, instant_t now);

/**
 * RFC 3339 timestamp in the given offset, followed by the zone label if
 * there is one, e.g. "2023-06-14T15:45:30-06:00 CST".
 */
std::string absolute_text(instant_t instant, std::chrono::seconds offset,
                          std::string_view zone_label = {});

// banner image with the text on it.
void write_banner(output_buffer &out, const std::string &text);

// analog clock face showing the instant in UTC.
void write_clock(output_buffer &out, instant_t instant);

// render a resolved instant according to its display intent.
void write_svg(output_buffer &out, const resolved_instant &resolved, instant_t now);

} // namespace timebanner

#endif /* SVG_HPP */
