/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

/* -*- coding: utf-8 -*- */
#include "timebanner/http.hpp"

#include "test_request.hpp"

#include <string>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

TEST_CASE("http_check_urldecode_path", "[http]") {
  CHECK(http::urldecode_path("%E3%82%A2") == "ア");
  CHECK(http::urldecode_path("%C3%80") == "À");

  // RFC 3986 - uppercase A-F are equivalent to lowercase a-f
  CHECK(http::urldecode_path("%e3%82%a2") == "ア");

  CHECK(http::urldecode_path("2023-06-14%2015:45") == "2023-06-14 15:45");
  CHECK(http::urldecode_path("%2B3600") == "+3600");

  // '+' is significant in relative expressions, it isn't a space here
  CHECK(http::urldecode_path("+3600") == "+3600");

  // malformed escapes pass through
  CHECK(http::urldecode_path("100%") == "100%");
  CHECK(http::urldecode_path("%zz") == "%zz");
  CHECK(http::urldecode_path("%4") == "%4");
}

TEST_CASE("http_check_list_methods", "[http]") {
  CHECK(http::list_methods(http::method::GET) == "GET");
  CHECK(http::list_methods(http::method::HEAD) == "HEAD");
  CHECK(http::list_methods(http::method::OPTIONS) == "OPTIONS");
  CHECK(http::list_methods(http::method::GET | http::method::OPTIONS) == "GET, OPTIONS");
  CHECK(http::list_methods(http::method::GET | http::method::HEAD | http::method::OPTIONS) == "GET, HEAD, OPTIONS");
}

TEST_CASE("http_check_parse_methods", "[http]") {
  CHECK(http::parse_method("GET") == http::method::GET);
  CHECK(http::parse_method("HEAD") == http::method::HEAD);
  CHECK(http::parse_method("OPTIONS") == http::method::OPTIONS);
  CHECK(http::parse_method("POST") == std::optional<http::method>{});
  CHECK(http::parse_method("get") == std::optional<http::method>{});
  CHECK(http::parse_method("") == std::optional<http::method>{});
}

TEST_CASE("http_check_choose_encoding", "[http]") {
  using http::content_coding;
  using http::choose_encoding;

  CHECK(choose_encoding("identity") == content_coding::identity);
  CHECK_THROWS_AS(choose_encoding("identity;q=0"), http::not_acceptable);
  CHECK_THROWS_AS(choose_encoding("compress"), http::not_acceptable);
  CHECK_THROWS_AS(choose_encoding("gzip;q=abc"), http::bad_request);
  CHECK_THROWS_AS(choose_encoding("gzip;q=0.5x"), http::bad_request);

  SECTION("Explicit qualities beat the wildcard wherever it is") {
    CHECK_THROWS_AS(choose_encoding("identity;q=0, *;q=0"), http::not_acceptable);
    CHECK(choose_encoding("*;q=0, identity") == content_coding::identity);
  }

  SECTION("Qualities out of range are ignored") {
    CHECK_THROWS_AS(choose_encoding("identity;q=2"), http::not_acceptable);
  }

  SECTION("Whitespace around parameters") {
    CHECK(choose_encoding(" identity ; q=0.5 ") == content_coding::identity);
  }

#ifdef HAVE_LIBZ
  CHECK(choose_encoding("deflate, gzip;q=1.0, *;q=0.5") == content_coding::deflate);
  CHECK(choose_encoding("gzip;q=1.0, identity;q=0.8, *;q=0.1") == content_coding::gzip);
  CHECK(choose_encoding("identity;q=0.8, gzip;q=1.0, *;q=0.1") == content_coding::gzip);
  CHECK(choose_encoding("gzip") == content_coding::gzip);
  CHECK(choose_encoding("deflate") == content_coding::deflate);
  CHECK(choose_encoding("gzip, deflate;q=0.5") == content_coding::gzip);
  CHECK(choose_encoding("gzip; q=0.4, identity; q=0.5") == content_coding::identity);
#endif
#if defined(HAVE_LIBZ) && !defined(HAVE_BROTLI)
  CHECK(choose_encoding("*") == content_coding::deflate);
  CHECK(choose_encoding("") == content_coding::deflate);
  CHECK(choose_encoding("gzip, deflate, br") == content_coding::deflate);
#endif
#ifdef HAVE_BROTLI
  CHECK(choose_encoding("*") == content_coding::brotli);
  CHECK(choose_encoding("") == content_coding::brotli);
  CHECK(choose_encoding("br") == content_coding::brotli);
  CHECK(choose_encoding("gzip, deflate, br") == content_coding::brotli);
  CHECK(choose_encoding("zstd;q=1.0, unknown;q=0.8, br;q=0.9") == content_coding::brotli);
#else
  CHECK_THROWS_AS(choose_encoding("br"), http::not_acceptable);
#endif
#if !defined(HAVE_LIBZ) && !defined(HAVE_BROTLI)
  CHECK(choose_encoding("*") == content_coding::identity);
  CHECK_THROWS_AS(choose_encoding("gzip"), http::not_acceptable);
#endif
}

TEST_CASE("http_check_coding_names", "[http]") {
  CHECK(std::string(http::to_string(http::content_coding::identity)) == "identity");
  CHECK(std::string(http::to_string(http::content_coding::deflate)) == "deflate");
  CHECK(std::string(http::to_string(http::content_coding::gzip)) == "gzip");
  CHECK(std::string(http::to_string(http::content_coding::brotli)) == "br");
}

TEST_CASE("http_check_encoded_buffer", "[http]") {
  string_buffer out;

  SECTION("identity passes bytes through") {
    auto buffer = http::encoded_buffer(http::content_coding::identity, out);
    CHECK(buffer->write("banner") == 6);
    CHECK(buffer->close() == 0);
    CHECK(out.str() == "banner");
  }

#ifndef HAVE_BROTLI
  SECTION("codings which aren't compiled in") {
    CHECK_THROWS_AS(http::encoded_buffer(http::content_coding::brotli, out), http::server_error);
  }
#endif
}

TEST_CASE("http_check_format_header", "[http]") {
  CHECK(http::format_header(200, {{"Content-Type", "image/svg+xml"}}) ==
        "Status: 200 OK\r\nContent-Type: image/svg+xml\r\n\r\n");
  CHECK(http::format_header(307, {}) == "Status: 307 Temporary Redirect\r\n\r\n");
}

TEST_CASE("http_check_exceptions", "[http]") {
  CHECK(http::bad_request("x").code() == 400);
  CHECK(http::not_found("x").code() == 404);
  CHECK(http::not_acceptable("x").code() == 406);
  CHECK(http::server_error("x").code() == 500);
  CHECK(std::string(http::not_acceptable("x").what()) == "x");
  CHECK(std::string(http::status_message(406)) == "Not Acceptable");
  CHECK(std::string(http::status_message(204)) == "No Content");

  http::method_not_allowed e(http::method::GET | http::method::HEAD);
  CHECK(e.code() == 405);
  CHECK(e.allowed_methods == (http::method::GET | http::method::HEAD));
}
