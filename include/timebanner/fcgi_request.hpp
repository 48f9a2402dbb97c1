/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef FCGI_REQUEST_HPP
#define FCGI_REQUEST_HPP

#include "timebanner/request.hpp"

#include <chrono>
#include <memory>
#include <string>

// from fcgiapp.h, which only the implementation needs
struct FCGX_Request;

/**
 * A request read from a FastCGI socket. The process keeps one of these and
 * reuses it for every request it accepts.
 */
class fcgi_request : public request {
public:
  explicit fcgi_request(int socket);
  ~fcgi_request() override;

  // listening socket for an address such as ":8000", "127.0.0.1:8000" or a
  // UNIX socket path. returns a negative value on failure.
  static int open_socket(const std::string &address, int backlog);

  // waits for the next request, finishing the current one. returns false
  // if a signal arrived first, throws on any other failure.
  bool accept();

  const char *get_param(const char *key) const override;
  std::chrono::system_clock::time_point get_current_time() const override;

protected:
  void send_head(int status, const http::headers_t &headers) override;
  output_buffer& body_buffer() override;

private:
  std::unique_ptr<FCGX_Request> m_request;
  std::unique_ptr<output_buffer> m_body;
  std::chrono::system_clock::time_point m_accepted;
};

#endif /* FCGI_REQUEST_HPP */
