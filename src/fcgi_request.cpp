/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/fcgi_request.hpp"
#include "timebanner/output_buffer.hpp"

#include <fcgiapp.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>

namespace {

// body of the response to the current request. libfcgi closes the stream
// itself when the next request is accepted.
class fcgi_stream_buffer : public output_buffer {
public:
  using output_buffer::write;

  explicit fcgi_stream_buffer(FCGX_Stream *stream) : m_stream(stream) {}

  int write(const char *buffer, int len) noexcept override {
    const int bytes = FCGX_PutStr(buffer, len, m_stream);
    if (bytes > 0)
      m_written += bytes;
    return bytes;
  }

  int written() const override { return m_written; }

  int close() noexcept override { return 0; }

  int flush() noexcept override { return FCGX_FFlush(m_stream); }

private:
  FCGX_Stream *m_stream;
  int m_written{0};
};

} // anonymous namespace

fcgi_request::fcgi_request(int socket) : m_request(std::make_unique<FCGX_Request>()) {
  if (FCGX_Init() != 0)
    throw std::runtime_error("Couldn't initialise the FastCGI library.");

  if (FCGX_InitRequest(m_request.get(), socket, FCGI_FAIL_ACCEPT_ON_INTR) != 0)
    throw std::runtime_error("Couldn't initialise the FastCGI request.");
}

fcgi_request::~fcgi_request() {
  FCGX_Finish_r(m_request.get());
  FCGX_Free(m_request.get(), 1);
}

int fcgi_request::open_socket(const std::string &address, int backlog) {
  return FCGX_OpenSocket(address.c_str(), backlog);
}

bool fcgi_request::accept() {
  if (FCGX_Accept_r(m_request.get()) < 0) {
    const int err = errno;
    if (err == EINTR)
      return false;
    if (err == ENOTSOCK)
      throw std::runtime_error("Not listening on a FastCGI socket, please use the --socket option.");
    throw std::runtime_error(fmt::format("Error accepting request: {}",
                                         std::system_category().message(err)));
  }

  m_accepted = std::chrono::system_clock::now();
  m_body = std::make_unique<fcgi_stream_buffer>(m_request->out);
  reset();

  return true;
}

const char *fcgi_request::get_param(const char *key) const {
  return FCGX_GetParam(key, m_request->envp);
}

std::chrono::system_clock::time_point fcgi_request::get_current_time() const {
  return m_accepted;
}

void fcgi_request::send_head(int status, const http::headers_t &headers) {
  if (m_body->write(http::format_header(status, headers)) < 0)
    throw write_error("Couldn't write the response head.");
}

output_buffer& fcgi_request::body_buffer() {
  return *m_body;
}
