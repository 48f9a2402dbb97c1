/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/request.hpp"
#include "timebanner/output_buffer.hpp"

#include <stdexcept>
#include <string_view>

#include <fmt/core.h>

std::string request::param(const char *key, const char *fallback) const {
  const char *value = get_param(key);
  if (value != nullptr)
    return value;
  if (fallback != nullptr)
    return fallback;
  throw http::server_error(fmt::format("request didn't set the ${} environment variable.", key));
}

std::string request::path() const {
  std::string_view uri;

  // PATH_INFO is the fallback when REQUEST_URI isn't set
  for (const char *key : {"REQUEST_URI", "PATH_INFO"}) {
    const char *value = get_param(key);
    if (value != nullptr && *value != '\0') {
      uri = value;
      break;
    }
  }

  if (uri.empty())
    throw http::server_error("request didn't set the $REQUEST_URI or $PATH_INFO environment variables.");

  return std::string(uri.substr(0, uri.find('?')));
}

request& request::status(int code) {
  advance_to(phase::head);
  m_status = code;
  return *this;
}

request& request::add_header(const std::string &key, const std::string &value) {
  advance_to(phase::head);
  m_headers.emplace_back(key, value);
  return *this;
}

output_buffer& request::body() {
  advance_to(phase::body);
  return body_buffer();
}

void request::finish() {
  advance_to(phase::finished);
}

void request::advance_to(phase next) {
  if (next < m_phase)
    throw std::logic_error(fmt::format("Response already past step {:d}, can't go back to {:d}.",
                                       static_cast<int>(m_phase), static_cast<int>(next)));

  if (m_phase == phase::head && next != phase::head)
    send_head(m_status, m_headers);

  m_phase = next;
}

void request::reset() {
  m_phase = phase::head;
  m_status = 500;
  m_headers.clear();
}
