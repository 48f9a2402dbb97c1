/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/zlib.hpp"

zlib_output_buffer::zlib_output_buffer(output_buffer& o,
                                       zlib_output_buffer::mode m)
    : out(o) {
  // 16 added to the window bits selects the gzip wrapper
  const int windowBits = (m == gzip) ? 15 + 16 : 15;

  stream.zalloc = Z_NULL;
  stream.zfree = Z_NULL;
  stream.opaque = Z_NULL;

  if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    throw write_error("deflateInit2 failed");
  }

  stream.next_in = nullptr;
  stream.avail_in = 0;
  stream.next_out = reinterpret_cast<Bytef *>(outbuf);
  stream.avail_out = sizeof(outbuf);
}

zlib_output_buffer::~zlib_output_buffer() {
  if (!finished)
    deflateEnd(&stream);
}

int zlib_output_buffer::write(const char *buffer, int len) noexcept {
  if (finished)
    return -1;

  if (len > 0) {
    int status = 0;

    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(buffer));
    stream.avail_in = len;

    for (status = deflate(&stream, Z_NO_FLUSH);
         status == Z_OK && stream.avail_in > 0;
         status = deflate(&stream, Z_NO_FLUSH)) {
      if (flush_output() < 0)
        return -1;
    }

    if (status != Z_OK)
      return -1;

    if (stream.avail_out == 0 && flush_output() < 0)
      return -1;
  }

  bytes_in += len;

  return len;
}

int zlib_output_buffer::close() noexcept {
  if (finished)
    return -1;

  int status = 0;

  for (status = deflate(&stream, Z_FINISH); status == Z_OK;
       status = deflate(&stream, Z_FINISH)) {
    if (flush_output() < 0)
      return -1;
  }

  if (status != Z_STREAM_END)
    return -1;

  if (flush_output() < 0)
    return -1;

  finished = true;
  if (deflateEnd(&stream) != Z_OK)
    return -1;

  return out.close();
}

int zlib_output_buffer::written() const { return bytes_in; }

int zlib_output_buffer::flush_output() noexcept {
  const int pending = sizeof(outbuf) - stream.avail_out;
  if (pending > 0 && out.write(outbuf, pending) < 0)
    return -1;

  stream.next_out = reinterpret_cast<Bytef *>(outbuf);
  stream.avail_out = sizeof(outbuf);
  return 0;
}

int zlib_output_buffer::flush() noexcept {
  if (flush_output() < 0)
    return -1;
  return out.flush();
}
