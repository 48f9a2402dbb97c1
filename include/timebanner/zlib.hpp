/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef ZLIB_HPP
#define ZLIB_HPP

#ifndef HAVE_LIBZ
#error This file should not be included when zlib is not available.
#endif

#include <zlib.h>
#include "timebanner/output_buffer.hpp"

/**
 * Compresses an output stream with deflate, either as a raw zlib stream
 * (Content-Encoding: deflate) or with a gzip wrapper.
 */
class zlib_output_buffer : public output_buffer {
public:
  enum mode { zlib, gzip };

  // throws write_error if zlib can't be initialised
  zlib_output_buffer(output_buffer& o, mode m);
  ~zlib_output_buffer() override;

  using output_buffer::write;
  int write(const char *buffer, int len) noexcept override;
  int written() const override;
  int close() noexcept override;
  int flush() noexcept override;

private:
  int flush_output() noexcept;

  output_buffer& out;
  // uncompressed bytes, the z_stream counters aren't updated until flushed.
  int bytes_in = 0;
  bool finished = false;
  z_stream stream{};
  char outbuf[4096];
};

#endif /* ZLIB_HPP */
