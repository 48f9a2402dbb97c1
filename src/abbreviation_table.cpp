/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/abbreviation_table.hpp"
#include "timebanner/parse_error.hpp"
#include "timebanner/utc_offset.hpp"
#include "timebanner/util.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <map>

#include <fmt/core.h>

namespace timebanner {

namespace {

/*
 * Canonical offsets for abbreviations which have several meanings in the
 * reference dataset. The North American reading wins where there is one,
 * otherwise the most populous zone.
 */
struct preferred_offset {
  std::string_view abbreviation;
  int seconds;
};

constexpr int hour = 3600;

constexpr std::array<preferred_offset, 14> preferred_offsets = {{
  {"ACT",   -5 * hour},          // Acre Time, not ASEAN Common Time
  {"AMT",   -4 * hour},          // Amazon Time, not Armenia Time
  {"AST",   -4 * hour},          // Atlantic Standard Time, not Arabia
  {"BST",    1 * hour},          // British Summer Time
  {"CDT",   -5 * hour},          // Central Daylight Time, not Cuba
  {"CST",   -6 * hour},          // Central Standard Time, not China or Cuba
  {"ECT",   -5 * hour},          // Ecuador Time
  {"GST",    4 * hour},          // Gulf Standard Time
  {"IST",    5 * hour + 1800},   // India Standard Time
  {"LHST",  10 * hour + 1800},   // Lord Howe Standard Time
  {"MST",   -7 * hour},          // Mountain Standard Time, not Malaysia
  {"PST",   -8 * hour},          // Pacific Standard Time, not Philippine
  {"SST",  -11 * hour},          // Samoa Standard Time, not Singapore
  {"WST",    8 * hour}           // Western Standard Time (Australia)
}};

struct candidate {
  std::string label;
  std::chrono::seconds offset;
  std::size_t line_number;
};

bool valid_abbreviation(std::string_view abbr) {
  return abbr.size() >= 2 && abbr.size() <= 5 &&
         std::ranges::all_of(abbr, [](char c) { return c >= 'A' && c <= 'Z'; });
}

std::optional<std::chrono::seconds> preferred_for(std::string_view abbr) {
  auto itr = std::ranges::find_if(preferred_offsets,
      [abbr](const preferred_offset &p) { return p.abbreviation == abbr; });
  if (itr == preferred_offsets.end())
    return {};
  return std::chrono::seconds{itr->seconds};
}

} // anonymous namespace

abbreviation_table::load_error::load_error(const std::string &message)
    : std::runtime_error(message) {}

abbreviation_table::abbreviation_table(std::vector<entry> &&entries)
    : m_entries(std::move(entries)) {}

abbreviation_table abbreviation_table::from_stream(std::istream &in,
                                                   const std::string &source_name) {

  // candidates grouped per abbreviation, in dataset order
  std::map<std::string, std::vector<candidate>, std::less<>> candidates;

  std::string line;
  std::size_t line_number = 0;

  while (std::getline(in, line)) {
    ++line_number;

    const auto trimmed = trim(std::string_view(line));
    if (trimmed.empty() || trimmed.starts_with('#'))
      continue;

    const auto fields = split(trimmed, '\t');
    if (fields.size() != 3) {
      throw load_error(fmt::format("{}:{}: expected 3 tab separated fields, found {}",
                                   source_name, line_number, fields.size()));
    }

    const auto abbr = trim(fields[0]);
    const auto label = trim(fields[1]);
    const auto raw_offset = trim(fields[2]);

    if (!valid_abbreviation(abbr)) {
      throw load_error(fmt::format("{}:{}: invalid abbreviation '{}'",
                                   source_name, line_number, abbr));
    }

    if (!raw_offset.starts_with("UTC")) {
      throw load_error(fmt::format("{}:{}: offset '{}' doesn't start with UTC",
                                   source_name, line_number, raw_offset));
    }

    std::chrono::seconds offset{};
    try {
      offset = parse_utc_offset(raw_offset.substr(3));
    } catch (const parse_error &e) {
      throw load_error(fmt::format("{}:{}: {}", source_name, line_number, e.what()));
    }

    candidates[std::string(abbr)].push_back(
        candidate{std::string(label), offset, line_number});
  }

  if (in.bad()) {
    throw load_error(fmt::format("{}: read error", source_name));
  }

  std::vector<entry> entries;
  entries.reserve(candidates.size());

  for (const auto &[abbr, options] : candidates) {

    auto chosen = options.begin();

    if (options.size() > 1) {
      if (auto preferred = preferred_for(abbr); preferred) {
        chosen = std::ranges::find(options, *preferred, &candidate::offset);
        if (chosen == options.end()) {
          throw load_error(fmt::format("{}: preferred offset {} for {} isn't in the dataset",
                                       source_name, format_utc_offset(*preferred), abbr));
        }
      }
    }

    const bool ambiguous = std::ranges::any_of(options,
        [&](const candidate &c) { return c.offset != chosen->offset; });

    entries.push_back(entry{abbr, chosen->label, chosen->offset, ambiguous});
  }

  // std::map iteration order already gives a sorted vector
  return abbreviation_table(std::move(entries));
}

abbreviation_table abbreviation_table::from_file(const std::string &path) {
  std::ifstream ifs(path);
  if (ifs.fail()) {
    throw load_error("Error opening abbreviation file: " + path);
  }
  return from_stream(ifs, path);
}

const abbreviation_table::entry &abbreviation_table::lookup(std::string_view abbreviation) const {

  auto itr = std::lower_bound(m_entries.begin(), m_entries.end(), abbreviation,
      [](const entry &e, std::string_view a) { return e.abbreviation < a; });

  if (itr == m_entries.end() || itr->abbreviation != abbreviation) {
    throw parse_error(fmt::format("Unknown timezone abbreviation: {}", abbreviation),
                      parse_error::kind::not_found);
  }

  return *itr;
}

} // namespace timebanner
