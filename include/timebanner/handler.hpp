/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef HANDLER_HPP
#define HANDLER_HPP

#include "timebanner/http.hpp"
#include "timebanner/mime_types.hpp"
#include "timebanner/output_buffer.hpp"
#include "timebanner/resolver.hpp"

#include <chrono>
#include <memory>
#include <string>

/**
 * state set up once at startup and shared, read-only, by every request.
 */
struct service_context {
  timebanner::resolver_context resolver;
  // Cache-Control max-age for absolute banners, which never change
  std::chrono::seconds max_age;
};

/**
 * object which is able to respond to an already-setup request.
 */
class responder {
public:
  explicit responder(mime::type);
  virtual ~responder() = default;

  // write the response body.
  virtual void write(output_buffer &out) = 0;

  mime::type resource_type() const;

  virtual int status() const;
  virtual std::string cache_control() const = 0;
  virtual http::headers_t extra_response_headers() const;

private:
  mime::type mime_type;
};

using responder_ptr_t = std::unique_ptr<responder>;

/**
 * object which is able to validate and create responders from
 * requests.
 */
class handler {
public:
  handler(mime::type default_type = mime::type::unspecified_type,
          http::method methods = http::banner_methods);
  virtual ~handler() = default;

  virtual std::string log_name() const = 0;
  virtual responder_ptr_t responder(const service_context &) const = 0;

  // the format requested by the path extension, if any.
  void set_resource_type(mime::type);
  mime::type resource_type() const;

  // returns true if the given method is allowed on this handler.
  constexpr bool allows_method(http::method m) const {
    return (m & m_allowed_methods) == m;
  }

  // returns the set of methods which are allowed on this handler.
  constexpr http::method allowed_methods() const {
    return m_allowed_methods;
  }

protected:
  mime::type mime_type;
  http::method m_allowed_methods;
};

using handler_ptr_t = std::unique_ptr<handler>;

#endif /* HANDLER_HPP */
