/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <string_view>

/**
 * Process-wide request log. Until initialise() is called, messages are
 * dropped.
 */
namespace logger {

/**
 * Open (or re-open, after log rotation) the log file in append mode.
 */
void initialise(const std::string &filename);

/**
 * Log a message, prefixed with the UTC time and the process id.
 */
void message(std::string_view m);
}

#endif /* LOGGER_HPP */
