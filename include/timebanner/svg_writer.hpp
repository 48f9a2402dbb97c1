/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef SVG_WRITER_HPP
#define SVG_WRITER_HPP

#include "timebanner/output_buffer.hpp"

#include <libxml/xmlwriter.h>

#include <array>
#include <charconv>
#include <string>
#include <type_traits>

namespace timebanner {

/**
 * Streams an SVG document into an output buffer through libxml2, which
 * takes care of escaping text and attribute values. Every failure is
 * reported as a write_error.
 */
class svg_writer {
public:
  svg_writer(const svg_writer &) = delete;
  svg_writer& operator=(const svg_writer &) = delete;

  // starts the document. out must outlive the writer, and is not closed by it.
  explicit svg_writer(output_buffer &out);
  ~svg_writer() noexcept;

  void start(const char *name);

  void attribute(const char *name, const std::string &value);
  void attribute(const char *name, const char *value);

  template <typename TInteger, std::enable_if_t<std::is_integral_v<TInteger>, bool> = true>
  void attribute(const char *name, TInteger value) {
    std::array<char, 32> buf;
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size() - 1, value);
    if (ec != std::errc())
      throw write_error("cannot convert integer attribute to string.");
    *ptr = '\0';
    attribute(name, buf.data());
  }

  void text(const std::string &t);

  void end();

  // closes any open elements and pushes the document out to the buffer.
  void finish();

private:
  xmlTextWriterPtr writer;
};

} // namespace timebanner

#endif /* SVG_WRITER_HPP */
