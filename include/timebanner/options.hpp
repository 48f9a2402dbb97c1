/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include "timebanner/absolute.hpp"
#include "timebanner/resolver.hpp"

#include <chrono>
#include <string>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

#ifndef DEFAULT_ABBREVIATIONS_FILE
#define DEFAULT_ABBREVIATIONS_FILE "data/timezone_abbreviations.tsv"
#endif

class global_settings_base {

public:
  virtual ~global_settings_base();

  virtual std::string get_abbreviations_file() const = 0;
  virtual timebanner::date_order get_date_order() const = 0;
  virtual bool get_strict() const = 0;
  virtual std::chrono::seconds get_max_age() const = 0;

  timebanner::resolver_config get_resolver_config() const {
    return timebanner::resolver_config{get_date_order(), get_strict()};
  }
};

class global_settings_default : public global_settings_base {

public:
  std::string get_abbreviations_file() const override {
    return DEFAULT_ABBREVIATIONS_FILE;
  }

  timebanner::date_order get_date_order() const override {
    return timebanner::date_order::ymd;
  }

  bool get_strict() const override {
    return false;
  }

  std::chrono::seconds get_max_age() const override {
    return std::chrono::days{365};
  }
};

/**
 * settings from the command line, environment and config file, falling back
 * to another set of settings (the defaults, unless given) for anything which
 * wasn't set. invalid values throw std::invalid_argument.
 */
class global_settings_via_options : public global_settings_base {

public:
  global_settings_via_options() = delete;

  explicit global_settings_via_options(const po::variables_map & options) {

    init_fallback_values(global_settings_default{});
    set_new_options(options);
  }

  global_settings_via_options(const po::variables_map & options,
                              const global_settings_base & fallback) {

    init_fallback_values(fallback);
    set_new_options(options);
  }

  std::string get_abbreviations_file() const override {
    return m_abbreviations_file;
  }

  timebanner::date_order get_date_order() const override {
    return m_date_order;
  }

  bool get_strict() const override {
    return m_strict;
  }

  std::chrono::seconds get_max_age() const override {
    return m_max_age;
  }

private:
  void init_fallback_values(const global_settings_base &def);
  void set_new_options(const po::variables_map &options);
  void set_abbreviations_file(const po::variables_map &options);
  void set_date_order(const po::variables_map &options);
  void set_strict(const po::variables_map &options);
  void set_max_age(const po::variables_map &options);

  std::string m_abbreviations_file;
  timebanner::date_order m_date_order;
  bool m_strict;
  std::chrono::seconds m_max_age;
};

#endif
