/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/parse_error.hpp"

namespace timebanner {

parse_error::parse_error(const std::string &message, kind k)
    : std::runtime_error(message), m_kind(k) {}

} // namespace timebanner
