/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef ROUTES_HPP
#define ROUTES_HPP

#include "timebanner/handler.hpp"
#include "timebanner/mime_types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

// internal implementation of the routes
struct router;
struct request;

/**
 * split the extension off the last path segment. only "svg" and "png"
 * (in any case) count as extensions, so that dotted dates such as
 * "2023.06.14" are left alone. without one, the whole segment is returned
 * with an unspecified type.
 */
std::pair<std::string_view, mime::type> split_extension(std::string_view path);

/**
 * encapsulates routing (URL to handler mapping) information.
 */
class routes {
public:
  routes();
  ~routes();

  routes(const routes &) = delete;
  routes& operator=(const routes &) = delete;
  routes(routes &&) = default;
  routes& operator=(routes &&) = default;

  /**
   * returns the handler which matches a request, or throws a 404 error.
   */
  handler_ptr_t operator()(request &req) const;

private:
  // object which actually does the routing.
  std::unique_ptr<router> r;
};

#endif /* ROUTES_HPP */
