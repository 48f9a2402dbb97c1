/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef PARSE_ERROR_HPP
#define PARSE_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace timebanner {

/**
 * Raised by the temporal expression parsers when the input can't be turned
 * into an instant. These are always caused by user input, so callers should
 * report them back to the client rather than treat them as server faults.
 */
class parse_error : public std::runtime_error {
public:
  enum class kind : uint8_t {
    malformed,     // input doesn't have the expected shape
    not_found,     // unknown timezone abbreviation
    out_of_range,  // a field or the resulting instant is out of range
    ambiguous      // abbreviation has several meanings (strict mode only)
  };

  explicit parse_error(const std::string &message, kind k = kind::malformed);

  kind error_kind() const noexcept { return m_kind; }

private:
  kind m_kind;
};

} // namespace timebanner

#endif /* PARSE_ERROR_HPP */
