/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef OUTPUT_BUFFER_HPP
#define OUTPUT_BUFFER_HPP

#include <stdexcept>
#include <string>
#include <string_view>

/**
 * Destination for response bodies. Writes are noexcept and report failure
 * with a return code of -1, since the client may go away at any time and
 * that isn't exceptional.
 */
struct output_buffer {
  virtual int write(const char *buffer, int len) noexcept = 0;
  virtual int write(std::string_view str) noexcept { return write(str.data(), str.size()); }
  virtual int written() const = 0;
  virtual int close() noexcept = 0;
  virtual int flush() noexcept = 0;
  virtual ~output_buffer() = default;

  output_buffer() = default;

  output_buffer(const output_buffer&) = delete;
  output_buffer& operator=(const output_buffer&) = delete;

  output_buffer(output_buffer&&) = delete;
  output_buffer& operator=(output_buffer&&) = delete;
};

/**
 * Raised when a buffer can't be set up, or when a body couldn't be written
 * in full. Once part of the body has gone out there is nothing to do but
 * abandon the request.
 */
class write_error : public std::runtime_error {
public:
  explicit write_error(const std::string &message) : std::runtime_error(message) {}
};

class identity_output_buffer : public output_buffer
{
public:
    using output_buffer::write;
    explicit identity_output_buffer(output_buffer& o) : out(o) {}

    int write(const char *buffer, int len) noexcept override { return out.write(buffer, len); }
    int written() const override { return out.written(); }
    int close() noexcept override { return out.close(); }
    int flush() noexcept override { return out.flush(); }

    ~identity_output_buffer() override = default;

private:
    output_buffer& out;
};

#endif /* OUTPUT_BUFFER_HPP */
