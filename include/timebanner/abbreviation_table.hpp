/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef ABBREVIATION_TABLE_HPP
#define ABBREVIATION_TABLE_HPP

#include <chrono>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace timebanner {

/**
 * Immutable map from timezone abbreviations ("CST", "JST", ...) to fixed UTC
 * offsets.
 *
 * Abbreviations aren't standardised and many of them mean several things
 * around the world. The table is built once at startup from a reference
 * dataset, one entry per line:
 *
 *   ABBR <tab> free text label <tab> UTC<offset token>
 *
 * Blank lines and lines starting with '#' are skipped. When an abbreviation
 * appears more than once, the offset named in a fixed precedence list wins
 * (e.g. CST is US Central rather than China or Cuba). Duplicates not on that
 * list resolve to their first occurrence in the dataset.
 *
 * After construction the table is never modified, so it can be shared by
 * const reference without locking.
 */
class abbreviation_table {
public:
  struct entry {
    std::string abbreviation;
    std::string label;
    std::chrono::seconds offset;
    // true if the dataset had other offsets for the same abbreviation
    bool ambiguous;
  };

  /**
   * Thrown when the reference dataset can't be read or is malformed. The
   * dataset is deploy-time configuration, so this is fatal.
   */
  class load_error : public std::runtime_error {
  public:
    explicit load_error(const std::string &message);
  };

  abbreviation_table(const abbreviation_table &) = delete;
  abbreviation_table& operator=(const abbreviation_table &) = delete;
  abbreviation_table(abbreviation_table &&) = default;
  abbreviation_table& operator=(abbreviation_table &&) = default;
  ~abbreviation_table() = default;

  // build from a stream, source_name is only used in error messages.
  static abbreviation_table from_stream(std::istream &in, const std::string &source_name);
  static abbreviation_table from_file(const std::string &path);

  // exact, case-sensitive lookup. throws parse_error (kind not_found) if the
  // abbreviation isn't known.
  const entry &lookup(std::string_view abbreviation) const;

  std::size_t size() const { return m_entries.size(); }

  const std::vector<entry> &entries() const { return m_entries; }

private:
  explicit abbreviation_table(std::vector<entry> &&entries);

  // sorted by abbreviation
  std::vector<entry> m_entries;
};

} // namespace timebanner

#endif /* ABBREVIATION_TABLE_HPP */
