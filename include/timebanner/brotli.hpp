/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef BROTLI_HPP
#define BROTLI_HPP

#ifndef HAVE_BROTLI
#error This file should not be included when brotli is not available.
#endif

#include <array>
#include <cstdint>

#include <brotli/encode.h>

#include "timebanner/output_buffer.hpp"

/**
 * Compresses an output stream with brotli (Content-Encoding: br).
 */
class brotli_output_buffer : public output_buffer {
public:
  // throws write_error if the encoder can't be created
  explicit brotli_output_buffer(output_buffer& o);
  ~brotli_output_buffer() override;

  using output_buffer::write;
  int write(const char *buffer, int len) noexcept override;
  int written() const override;
  int close() noexcept override;
  int flush() noexcept override;

private:
  int compress(const char *data, int data_length, BrotliEncoderOperation operation) noexcept;

  output_buffer& out;
  BrotliEncoderState *state = nullptr;
  std::array<uint8_t, 16384> buff{};
  int bytes_in = 0;
  bool finished = false;
};

#endif /* BROTLI_HPP */
