/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include <ctime>
#include <fstream>
#include <memory>
#include <unistd.h>

#include <fmt/chrono.h>
#include <fmt/ostream.h>

#include "timebanner/logger.hpp"

namespace logger {

static std::unique_ptr<std::ostream> stream;
static pid_t pid;

void initialise(const std::string &filename) {
  stream = std::make_unique<std::ofstream>(filename, std::ios_base::out | std::ios_base::app);
  pid = getpid();
}

void message(std::string_view m) {
  if (stream) {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    fmt::print(*stream, "[{:%FT%T} #{}] {}\n", utc, pid, m);
    stream->flush();
  }
}

}
