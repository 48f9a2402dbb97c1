/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef HTTP_HPP
#define HTTP_HPP

#include "timebanner/output_buffer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * The parts of HTTP the banner service speaks. Nothing FastCGI specific
 * lives here.
 */
namespace http {

enum class method : uint8_t {
  GET     = 0b001,
  HEAD    = 0b010,
  OPTIONS = 0b100
};

constexpr method operator|(method a, method b) {
  return static_cast<method>(static_cast<std::underlying_type_t<method>>(a) |
                             static_cast<std::underlying_type_t<method>>(b));
}

constexpr method operator&(method a, method b) {
  return static_cast<method>(static_cast<std::underlying_type_t<method>>(a) &
                             static_cast<std::underlying_type_t<method>>(b));
}

// every method a banner can be fetched with
constexpr method banner_methods = method::GET | method::HEAD | method::OPTIONS;

// "GET, HEAD", as used in the Allow header.
std::string list_methods(method m);

// exact, case-sensitive match of a request method name.
std::optional<method> parse_method(std::string_view name);

using headers_t = std::vector<std::pair<std::string, std::string>>;

const char *status_message(int code);

// CGI style response head: a Status line, the headers and a blank line.
std::string format_header(int status, const headers_t &headers);

/**
 * An error which is reported to the client with the given status code. The
 * message is meant for humans.
 */
class exception : public std::runtime_error {
public:
  int code() const noexcept { return m_code; }

protected:
  exception(int code, const std::string &message);

private:
  int m_code;
};

// the expression in the path couldn't be resolved.
class bad_request : public exception {
public:
  explicit bad_request(const std::string &message);
};

class not_found : public exception {
public:
  explicit not_found(const std::string &path);
};

class method_not_allowed : public exception {
public:
  explicit method_not_allowed(method allowed);
  method allowed_methods;
};

// the requested format or content encoding can't be produced.
class not_acceptable : public exception {
public:
  explicit not_acceptable(const std::string &message);
};

class server_error : public exception {
public:
  explicit server_error(const std::string &message);
};

/**
 * Decodes %-escapes in a path segment. Unlike form decoding, '+' is kept
 * as it is, since it's significant in relative time expressions.
 */
std::string urldecode_path(std::string_view s);

enum class content_coding { identity, deflate, gzip, brotli };

// the Content-Encoding token, e.g. "br".
const char *to_string(content_coding coding);

/**
 * Picks the content coding for a response from an Accept-Encoding header.
 * The highest quality wins, with ties going to br, then deflate, then gzip,
 * then identity. Only codings compiled in are considered. Throws
 * not_acceptable if none is acceptable, and bad_request if a quality value
 * can't be parsed.
 */
content_coding choose_encoding(std::string_view accept_encoding);

// a buffer which applies the coding to everything written to it before
// passing it on to out.
std::unique_ptr<output_buffer> encoded_buffer(content_coding coding, output_buffer &out);

} // namespace http

#endif /* HTTP_HPP */
