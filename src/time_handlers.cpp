/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/time_handlers.hpp"
#include "timebanner/parse_error.hpp"
#include "timebanner/svg.hpp"

#include <fmt/core.h>

namespace timebanner {

namespace {

instant_t request_time(const request &req) {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(req.get_current_time());
}

// only SVG is produced here, rasterising is left to something in front of us
void check_renderable(mime::type requested) {
  if (requested == mime::type::image_png)
    throw http::not_acceptable("PNG output is not supported, request the .svg banner instead.");
}

std::string cache_control_for(display_intent intent, std::chrono::seconds max_age) {
  if (intent == display_intent::absolute)
    return fmt::format("public, max-age={}", max_age.count());
  return "no-cache";
}

} // anonymous namespace

banner_responder::banner_responder(resolved_instant resolved, instant_t now,
                                   std::string cache_control)
  : responder(mime::type::image_svg), m_resolved(std::move(resolved)), m_now(now),
    m_cache_control(std::move(cache_control)) {}

void banner_responder::write(output_buffer &out) {
  write_svg(out, m_resolved, m_now);
}

std::string banner_responder::cache_control() const { return m_cache_control; }

redirect_responder::redirect_responder(std::string location)
  : responder(mime::type::text_plain), m_location(std::move(location)) {}

void redirect_responder::write(output_buffer &) {}

int redirect_responder::status() const { return 307; }

std::string redirect_responder::cache_control() const { return "no-cache"; }

http::headers_t redirect_responder::extra_response_headers() const {
  return {{"Location", m_location}};
}

expression_handler::expression_handler(request &req, std::string expression,
                                       std::optional<display_intent> intent)
  : m_expression(std::move(expression)), m_now(request_time(req)), m_intent(intent) {}

responder_ptr_t expression_handler::responder(const service_context &ctx) const {
  check_renderable(mime_type);

  resolved_instant resolved;
  try {
    resolved = resolve(m_expression, ctx.resolver, m_now);
  } catch (const parse_error &e) {
    throw http::bad_request(e.what());
  }

  if (m_intent)
    resolved.intent = *m_intent;

  const auto cache_control = cache_control_for(resolved.intent, ctx.max_age);
  return std::make_unique<banner_responder>(std::move(resolved), m_now, cache_control);
}

relative_handler::relative_handler(request &req, std::string expression)
  : expression_handler(req, std::move(expression), display_intent::relative) {}

std::string relative_handler::log_name() const {
  return fmt::format("relative/{}", m_expression);
}

absolute_handler::absolute_handler(request &req, std::string expression)
  : expression_handler(req, std::move(expression), display_intent::absolute) {}

std::string absolute_handler::log_name() const {
  return fmt::format("absolute/{}", m_expression);
}

implicit_handler::implicit_handler(request &req, std::string expression)
  : expression_handler(req, std::move(expression), std::nullopt) {
  if (m_expression == "relative" || m_expression == "absolute")
    throw http::not_found(fmt::format("/{} needs an expression after it", m_expression));
}

std::string implicit_handler::log_name() const {
  return m_expression;
}

clock_handler::clock_handler(request &req) : m_now(request_time(req)) {}

std::string clock_handler::log_name() const { return "favicon"; }

responder_ptr_t clock_handler::responder(const service_context &) const {
  check_renderable(mime_type);

  return std::make_unique<banner_responder>(resolve_clock(m_now), m_now, "no-cache");
}

index_handler::index_handler(request &req) : m_now(request_time(req)) {}

std::string index_handler::log_name() const { return "index"; }

responder_ptr_t index_handler::responder(const service_context &) const {
  const auto epoch = std::chrono::floor<std::chrono::seconds>(m_now).time_since_epoch().count();
  return std::make_unique<redirect_responder>(fmt::format("/relative/{}", epoch));
}

} // namespace timebanner
