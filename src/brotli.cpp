/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/brotli.hpp"

namespace {

// 0 (fastest) to 11 (smallest)
constexpr uint32_t brotli_quality = 5;

} // anonymous namespace

brotli_output_buffer::brotli_output_buffer(output_buffer& o)
    : out(o) {

  state = BrotliEncoderCreateInstance(nullptr, nullptr, nullptr);
  if (state == nullptr)
    throw write_error("BrotliEncoderCreateInstance failed");

  BrotliEncoderSetParameter(state, BROTLI_PARAM_QUALITY, brotli_quality);
}

brotli_output_buffer::~brotli_output_buffer() {
  if (state != nullptr)
    BrotliEncoderDestroyInstance(state);
}

int brotli_output_buffer::compress(const char *data, int data_length,
                                   BrotliEncoderOperation operation) noexcept {
  size_t available_in = data_length;
  auto next_in = reinterpret_cast<const uint8_t *>(data);

  do {
    size_t available_out = buff.size();
    auto next_out = buff.data();

    if (!BrotliEncoderCompressStream(state, operation, &available_in, &next_in,
                                     &available_out, &next_out, nullptr))
      return -1;

    const auto output_bytes = buff.size() - available_out;
    if (output_bytes > 0 &&
        out.write(reinterpret_cast<const char *>(buff.data()), static_cast<int>(output_bytes)) < 0)
      return -1;

  } while (operation == BROTLI_OPERATION_FINISH
               ? !BrotliEncoderIsFinished(state)
               : (available_in > 0 || BrotliEncoderHasMoreOutput(state)));

  return data_length;
}

int brotli_output_buffer::write(const char *buffer, int len) noexcept {
  if (finished)
    return -1;

  if (len > 0 && compress(buffer, len, BROTLI_OPERATION_PROCESS) < 0)
    return -1;

  bytes_in += len;
  return len;
}

int brotli_output_buffer::written() const { return bytes_in; }

int brotli_output_buffer::close() noexcept {
  if (finished)
    return -1;

  if (compress(nullptr, 0, BROTLI_OPERATION_FINISH) < 0)
    return -1;

  finished = true;
  return out.close();
}

int brotli_output_buffer::flush() noexcept {
  if (finished)
    return -1;

  if (compress(nullptr, 0, BROTLI_OPERATION_FLUSH) < 0)
    return -1;

  return out.flush();
}
