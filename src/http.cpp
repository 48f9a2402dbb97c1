/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/http.hpp"
#include "timebanner/util.hpp"

#ifdef HAVE_LIBZ
#include "timebanner/zlib.hpp"
#endif

#ifdef HAVE_BROTLI
#include "timebanner/brotli.hpp"
#endif

#include <array>
#include <charconv>

#include <fmt/core.h>

namespace http {

namespace {

constexpr std::array<std::pair<method, std::string_view>, 3> method_names = {{
  {method::GET,     "GET"},
  {method::HEAD,    "HEAD"},
  {method::OPTIONS, "OPTIONS"}
}};

constexpr std::array<std::pair<int, const char *>, 8> status_messages = {{
  {200, "OK"},
  {204, "No Content"},
  {307, "Temporary Redirect"},
  {400, "Bad Request"},
  {404, "Not Found"},
  {405, "Method Not Allowed"},
  {406, "Not Acceptable"},
  {500, "Internal Server Error"}
}};

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

constexpr bool compiled_in(content_coding coding) {
  switch (coding) {
  case content_coding::identity:
    return true;
  case content_coding::deflate:
  case content_coding::gzip:
#ifdef HAVE_LIBZ
    return true;
#else
    return false;
#endif
  case content_coding::brotli:
#ifdef HAVE_BROTLI
    return true;
#else
    return false;
#endif
  }
  return false;
}

float parse_quality(std::string_view item, std::string_view value) {
  float q{};
  const auto *end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), end, q);
  if (ec != std::errc() || ptr != end)
    throw bad_request(fmt::format("Invalid quality value in Accept-Encoding: {}", item));
  return q;
}

} // anonymous namespace

std::string list_methods(method m) {
  std::string result;
  for (const auto &[value, name] : method_names) {
    if ((m & value) != value)
      continue;
    if (!result.empty())
      result += ", ";
    result += name;
  }
  return result;
}

std::optional<method> parse_method(std::string_view name) {
  for (const auto &[value, known] : method_names) {
    if (known == name)
      return value;
  }
  return {};
}

const char *status_message(int code) {
  for (const auto &[known, message] : status_messages) {
    if (known == code)
      return message;
  }
  return "Internal Server Error";
}

std::string format_header(int status, const headers_t &headers) {
  auto head = fmt::format("Status: {} {}\r\n", status, status_message(status));
  for (const auto &[name, value] : headers)
    head += fmt::format("{}: {}\r\n", name, value);
  head += "\r\n";
  return head;
}

exception::exception(int code, const std::string &message)
  : std::runtime_error(message), m_code(code) {}

bad_request::bad_request(const std::string &message) : exception(400, message) {}

not_found::not_found(const std::string &path) : exception(404, path) {}

method_not_allowed::method_not_allowed(method allowed)
  : exception(405, list_methods(allowed)), allowed_methods(allowed) {}

not_acceptable::not_acceptable(const std::string &message) : exception(406, message) {}

server_error::server_error(const std::string &message) : exception(500, message) {}

std::string urldecode_path(std::string_view s) {
  std::string result;
  result.reserve(s.size());

  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%' && i + 2 < s.size()) {
      const int hi = hex_value(s[i + 1]);
      const int lo = hex_value(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        result += static_cast<char>(hi * 16 + lo);
        i += 2;
        continue;
      }
    }
    // malformed escapes are passed through untouched
    result += s[i];
  }

  return result;
}

const char *to_string(content_coding coding) {
  switch (coding) {
  case content_coding::identity: return "identity";
  case content_coding::deflate:  return "deflate";
  case content_coding::gzip:     return "gzip";
  case content_coding::brotli:   return "br";
  }
  return "identity";
}

content_coding choose_encoding(std::string_view accept_encoding) {
  struct candidate {
    content_coding coding;
    std::optional<float> quality;
  };

  // in order of preference
  std::array<candidate, 4> candidates = {{
    {content_coding::brotli, {}},
    {content_coding::deflate, {}},
    {content_coding::gzip, {}},
    {content_coding::identity, {}}
  }};
  std::optional<float> wildcard;
  bool listed_any = false;

  for (auto item : split(accept_encoding, ',')) {
    item = trim(item);
    if (item.empty())
      continue;
    listed_any = true;

    const auto params = split(item, ';');
    const auto name = trim(params.front());

    float quality = 1.0;
    for (std::size_t i = 1; i < params.size(); ++i) {
      const auto param = trim(params[i]);
      if (param.starts_with("q="))
        quality = parse_quality(item, param.substr(2));
    }

    // qualities outside 0..1 make the whole item meaningless
    if (quality < 0 || quality > 1)
      continue;

    if (name == "*") {
      wildcard = quality;
      continue;
    }

    for (auto &c : candidates) {
      if (name == to_string(c.coding))
        c.quality = quality;
    }
  }

  // an empty header accepts anything
  if (!listed_any)
    wildcard = 1.0;

  std::optional<content_coding> best;
  float best_quality = 0.0;

  for (const auto &c : candidates) {
    if (!compiled_in(c.coding))
      continue;

    const float quality = c.quality.value_or(wildcard.value_or(0.0));
    if (quality > best_quality) {
      best = c.coding;
      best_quality = quality;
    }
  }

  if (!best)
    throw not_acceptable("No acceptable content encoding found. Only "
                         "identity, deflate, gzip and br are supported.");
  return *best;
}

std::unique_ptr<output_buffer> encoded_buffer(content_coding coding, output_buffer &out) {
  switch (coding) {
  case content_coding::identity:
    return std::make_unique<identity_output_buffer>(out);
#ifdef HAVE_LIBZ
  case content_coding::deflate:
    return std::make_unique<zlib_output_buffer>(out, zlib_output_buffer::zlib);
  case content_coding::gzip:
    return std::make_unique<zlib_output_buffer>(out, zlib_output_buffer::gzip);
#endif
#ifdef HAVE_BROTLI
  case content_coding::brotli:
    return std::make_unique<brotli_output_buffer>(out);
#endif
  default:
    throw server_error(fmt::format("Content encoding {} isn't available.", to_string(coding)));
  }
}

} // namespace http
