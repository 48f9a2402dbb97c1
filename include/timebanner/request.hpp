/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef REQUEST_HPP
#define REQUEST_HPP

#include "timebanner/http.hpp"

#include <chrono>
#include <string>

struct output_buffer;

/**
 * One client request and the response to it.
 *
 * The response is built in order: status and headers first, then the body.
 * The head goes out when the body is first asked for, or on finish() when
 * there is no body. Going back to an earlier step throws std::logic_error.
 */
struct request {
  request() = default;
  virtual ~request() = default;

  request(const request &) = delete;
  request& operator=(const request &) = delete;

  // a value from the CGI environment, or nullptr if it isn't set.
  virtual const char *get_param(const char *key) const = 0;

  // as get_param, but with a fallback. without one, a missing value is a
  // server_error, since the web server is expected to always set it.
  std::string param(const char *key, const char *fallback = nullptr) const;

  // the request path without any query string, still %-encoded.
  std::string path() const;

  // when the request was accepted. every expression and clock face in the
  // request is relative to this.
  virtual std::chrono::system_clock::time_point get_current_time() const = 0;

  request& status(int code);
  request& add_header(const std::string &key, const std::string &value);

  // where the body goes. sends the head on the first call.
  output_buffer& body();

  // completes the response, sending the head if that hasn't happened yet.
  void finish();

protected:
  virtual void send_head(int status, const http::headers_t &headers) = 0;
  virtual output_buffer& body_buffer() = 0;

  // ready for the next request on the same connection object.
  void reset();

private:
  enum class phase { head, body, finished };

  void advance_to(phase next);

  phase m_phase{phase::head};
  int m_status{500};
  http::headers_t m_headers;
};

#endif /* REQUEST_HPP */
