/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/router.hpp"
#include "timebanner/http.hpp"

namespace match {

match_string::match_string(const char *s) : str(std::string_view(s)) {}

std::pair<match_string::match_type, bool> match_string::match(part_iterator &begin,
                                             const part_iterator &end) const noexcept {
  bool matches = false;
  if (begin != end) {
    matches = (*begin == str);
    ++begin;
  }
  return {match_type(), !matches};
}

std::pair<match_expression::match_type, bool> match_expression::match(part_iterator &begin,
                                             const part_iterator &end) const {
  if (begin == end || begin->empty())
    return {match_type(), true};

  auto decoded = http::urldecode_path(*begin);
  ++begin;
  return {match_type(std::move(decoded)), false};
}

}
