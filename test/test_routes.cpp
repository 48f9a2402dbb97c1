/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/routes.hpp"
#include "timebanner/http.hpp"
#include "timebanner/mime_types.hpp"

#include "test_request.hpp"

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

namespace {

handler_ptr_t route_for(const std::string &uri) {
  test_request req;
  req.set_param("REQUEST_URI", uri);

  routes route;
  return route(req);
}

} // anonymous namespace

TEST_CASE("Split the extension off a path", "[routes]") {
  using mime::type;

  CHECK(split_extension("1700000000.svg") == std::pair<std::string_view, type>{"1700000000", type::image_svg});
  CHECK(split_extension("relative/+1d.PNG") == std::pair<std::string_view, type>{"relative/+1d", type::image_png});
  CHECK(split_extension("favicon.Svg") == std::pair<std::string_view, type>{"favicon", type::image_svg});

  SECTION("Dotted dates aren't extensions") {
    CHECK(split_extension("2023.06.14") == std::pair<std::string_view, type>{"2023.06.14", type::unspecified_type});
    CHECK(split_extension("absolute/2023.06.14.15.45") ==
          std::pair<std::string_view, type>{"absolute/2023.06.14.15.45", type::unspecified_type});
  }

  SECTION("Only known extensions are split off") {
    CHECK(split_extension("favicon.ico") == std::pair<std::string_view, type>{"favicon.ico", type::unspecified_type});
    CHECK(split_extension("banner.json") == std::pair<std::string_view, type>{"banner.json", type::unspecified_type});
  }

  SECTION("Something has to come before the extension") {
    CHECK(split_extension(".svg") == std::pair<std::string_view, type>{".svg", type::unspecified_type});
    CHECK(split_extension("relative/.svg") == std::pair<std::string_view, type>{"relative/.svg", type::unspecified_type});
  }

  SECTION("The dot has to be in the last segment") {
    CHECK(split_extension("a.svg/b") == std::pair<std::string_view, type>{"a.svg/b", type::unspecified_type});
  }

  CHECK(split_extension("") == std::pair<std::string_view, type>{"", type::unspecified_type});
}

TEST_CASE("Route to handlers", "[routes]") {
  CHECK(route_for("/")->log_name() == "index");
  CHECK(route_for("/favicon.ico")->log_name() == "favicon");
  CHECK(route_for("/favicon.svg")->log_name() == "favicon");
  CHECK(route_for("/relative/+1d")->log_name() == "relative/+1d");
  CHECK(route_for("/absolute/2023-06-14")->log_name() == "absolute/2023-06-14");
  CHECK(route_for("/1700000000")->log_name() == "1700000000");
  CHECK(route_for("/2023.06.14")->log_name() == "2023.06.14");
}

TEST_CASE("Expressions are percent-decoded", "[routes]") {
  CHECK(route_for("/relative/%2B1%20day")->log_name() == "relative/+1 day");
  CHECK(route_for("/2023-06-14%2015:45%20CST")->log_name() == "2023-06-14 15:45 CST");
}

TEST_CASE("Query strings are ignored", "[routes]") {
  CHECK(route_for("/1700000000.svg?cache=bust")->log_name() == "1700000000");
}

TEST_CASE("Extensions set the resource type", "[routes]") {
  CHECK(route_for("/1700000000")->resource_type() == mime::type::unspecified_type);
  CHECK(route_for("/1700000000.svg")->resource_type() == mime::type::image_svg);
  CHECK(route_for("/relative/-1h.png")->resource_type() == mime::type::image_png);
}

TEST_CASE("Unknown paths", "[routes]") {
  CHECK_THROWS_AS(route_for("/a/b/c"), http::not_found);
  CHECK_THROWS_AS(route_for("/relative/"), http::not_found);
  CHECK_THROWS_AS(route_for("/absolute/a/b"), http::not_found);
  CHECK_THROWS_AS(route_for("//"), http::not_found);
}

TEST_CASE("Route prefixes need an expression", "[routes]") {
  CHECK_THROWS_AS(route_for("/relative"), http::not_found);
  CHECK_THROWS_AS(route_for("/absolute"), http::not_found);
  CHECK_THROWS_AS(route_for("/relative.svg"), http::not_found);
}

TEST_CASE("Path from the request environment", "[routes]") {
  SECTION("PATH_INFO when there's no REQUEST_URI") {
    test_request req;
    req.set_param("PATH_INFO", "/1700000000");
    CHECK(routes()(req)->log_name() == "1700000000");
  }

  SECTION("Neither is a server error") {
    test_request req;
    CHECK_THROWS_AS(routes()(req), http::server_error);
  }
}

TEST_CASE("Handlers allow every banner method", "[routes]") {
  CHECK(route_for("/1700000000")->allowed_methods() == http::banner_methods);
  CHECK(route_for("/")->allows_method(http::method::HEAD));
}
