/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/options.hpp"

#include <stdexcept>

#include <fmt/core.h>

global_settings_base::~global_settings_base() = default;

void global_settings_via_options::init_fallback_values(const global_settings_base &def) {

  m_abbreviations_file = def.get_abbreviations_file();
  m_date_order = def.get_date_order();
  m_strict = def.get_strict();
  m_max_age = def.get_max_age();
}

void global_settings_via_options::set_new_options(const po::variables_map &options) {

  set_abbreviations_file(options);
  set_date_order(options);
  set_strict(options);
  set_max_age(options);
}

void global_settings_via_options::set_abbreviations_file(const po::variables_map &options) {
  if (options.count("abbreviations")) {
    auto file = options["abbreviations"].as<std::string>();
    if (file.empty())
      throw std::invalid_argument("abbreviations must name a file");
    m_abbreviations_file = file;
  }
}

void global_settings_via_options::set_date_order(const po::variables_map &options) {
  if (options.count("date-order")) {
    auto name = options["date-order"].as<std::string>();
    auto order = timebanner::date_order_from_string(name);
    if (!order)
      throw std::invalid_argument(fmt::format("date-order must be one of ymd, mdy or dmy, not '{}'", name));
    m_date_order = *order;
  }
}

void global_settings_via_options::set_strict(const po::variables_map &options) {
  if (options.count("strict")) {
    m_strict = options["strict"].as<bool>();
  }
}

void global_settings_via_options::set_max_age(const po::variables_map &options) {
  if (options.count("max-age")) {
    auto max_age = options["max-age"].as<long>();
    if (max_age < 0)
      throw std::invalid_argument("max-age must not be negative");
    m_max_age = std::chrono::seconds{max_age};
  }
}
