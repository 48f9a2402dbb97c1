/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef TIME_HANDLERS_HPP
#define TIME_HANDLERS_HPP

#include "timebanner/handler.hpp"
#include "timebanner/request.hpp"
#include "timebanner/resolver.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace timebanner {

/**
 * writes the SVG for an instant which has already been resolved.
 */
class banner_responder : public responder {
public:
  banner_responder(resolved_instant resolved, instant_t now, std::string cache_control);

  void write(output_buffer &out) override;
  std::string cache_control() const override;

private:
  resolved_instant m_resolved;
  instant_t m_now;
  std::string m_cache_control;
};

/**
 * empty 307 response pointing somewhere else.
 */
class redirect_responder : public responder {
public:
  explicit redirect_responder(std::string location);

  void write(output_buffer &out) override;
  int status() const override;
  std::string cache_control() const override;
  http::headers_t extra_response_headers() const override;

private:
  std::string m_location;
};

/**
 * resolves the temporal expression from the path and renders it. a
 * parse_error becomes a 400 for the client.
 */
class expression_handler : public handler {
public:
  expression_handler(request &req, std::string expression,
                     std::optional<display_intent> intent);

  responder_ptr_t responder(const service_context &ctx) const override;

protected:
  std::string m_expression;

private:
  instant_t m_now;
  // display style forced by the route, otherwise the resolver decides
  std::optional<display_intent> m_intent;
};

// /relative/<expr>
class relative_handler : public expression_handler {
public:
  relative_handler(request &req, std::string expression);
  std::string log_name() const override;
};

// /absolute/<expr>
class absolute_handler : public expression_handler {
public:
  absolute_handler(request &req, std::string expression);
  std::string log_name() const override;
};

// /<expr>. the route prefixes on their own aren't expressions, so
// "/relative" and "/absolute" are not found.
class implicit_handler : public expression_handler {
public:
  implicit_handler(request &req, std::string expression);
  std::string log_name() const override;
};

// /favicon.ico, /favicon.svg
class clock_handler : public handler {
public:
  explicit clock_handler(request &req);
  std::string log_name() const override;
  responder_ptr_t responder(const service_context &ctx) const override;

private:
  instant_t m_now;
};

// "/" sends the client to the relative banner for the current time
class index_handler : public handler {
public:
  explicit index_handler(request &req);
  std::string log_name() const override;
  responder_ptr_t responder(const service_context &ctx) const override;

private:
  instant_t m_now;
};

} // namespace timebanner

#endif /* TIME_HANDLERS_HPP */
