/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/routes.hpp"
#include "timebanner/handler.hpp"
#include "timebanner/http.hpp"
#include "timebanner/request.hpp"
#include "timebanner/router.hpp"
#include "timebanner/time_handlers.hpp"
#include "timebanner/util.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <fmt/core.h>

// rules can only construct handler subclasses
template <typename Handler>
concept Routable = std::is_base_of_v<handler, Handler>;

/**
 * maps router DSL expressions to constructors for handlers, so that
 * .GET<Type>(root_ / "relative" / expression_) constructs the Type handler
 * with the request and the matched expression as parameters.
 */
struct router {
  // interface through which all matches and constructions are performed.
  struct rule_base {
    virtual ~rule_base() = default;
    virtual std::unique_ptr<handler> invoke_if(const std::vector<std::string_view> &, request &) = 0;
  };

  template <typename Handler, typename Rule>
  struct rule : public rule_base {
    explicit constexpr rule(Rule&& r) : r(std::forward<Rule>(r)) {}

    // try to match the expression. if it succeeds, call the Handler constructor
    // with the request and the matched DSL arguments.
    std::unique_ptr<handler> invoke_if(const std::vector<std::string_view> &parts,
                                       request &params) override {

      auto begin = parts.cbegin();
      auto [sequence, error] = r.match(begin, parts.cend());

      if (error)
        return nullptr;

      if (begin != parts.cend()) // still some unmatched parts left
        return nullptr;

      return std::apply(
          [&params](auto &&...args) {
            return std::make_unique<Handler>(
                params, std::forward<decltype(args)>(args)...);
          },
          std::move(sequence));
    }

    private:
      Rule r;
  };

  // HEAD and OPTIONS are served by every GET rule.
  template <Routable Handler, typename Rule>
  router& GET(Rule&& r) {
    rules_get.push_back(std::make_unique<rule<Handler, std::decay_t<Rule>> >(std::decay_t<Rule>(r)));
    return *this;
  }

  // the first matching rule wins.
  std::unique_ptr<handler> match(const std::vector<std::string_view> &p, request &params) const {
    for (const auto &rptr : rules_get) {
      if (auto hptr = rptr->invoke_if(p, params))
        return hptr;
    }
    return nullptr;
  }

private:
  using rule_ptr = std::unique_ptr<rule_base>;

  std::vector<rule_ptr> rules_get;
};

std::pair<std::string_view, mime::type> split_extension(std::string_view path) {
  const auto dot = path.rfind('.');
  const auto slash = path.rfind('/');

  // the dot has to be in the last segment, with something before it
  if (dot == std::string_view::npos || dot == 0 ||
      (slash != std::string_view::npos && (dot < slash || dot == slash + 1)))
    return {path, mime::type::unspecified_type};

  const auto type = mime::from_extension(path.substr(dot + 1));
  if (type == mime::type::unspecified_type)
    return {path, mime::type::unspecified_type};

  return {path.substr(0, dot), type};
}

routes::routes() : r(std::make_unique<router>()) {
  using match::root_;
  using match::expression_;
  using namespace timebanner;

  // literal routes have to be listed before the catch-all expression
  r->GET<index_handler>(root_)
    .GET<clock_handler>(root_ / "favicon.ico")
    .GET<clock_handler>(root_ / "favicon")
    .GET<relative_handler>(root_ / "relative" / expression_)
    .GET<absolute_handler>(root_ / "absolute" / expression_)
    .GET<implicit_handler>(root_ / expression_);
}

routes::~routes() = default;

handler_ptr_t routes::operator()(request &req) const {
  // full path from request handler
  const auto path = req.path();

  if (!path.starts_with('/'))
    throw http::not_found(fmt::format("Path does not match any known routes: {}", path));

  // strip off the extension, if there is one
  auto [resource, mime_type] = split_extension(std::string_view(path).substr(1));

  // split the URL into bits to be matched. "/" has no parts at all.
  std::vector<std::string_view> path_components;
  if (!resource.empty())
    path_components = split(resource, '/');

  auto hptr = r->match(path_components, req);

  if (!hptr)
    throw http::not_found(fmt::format("Path does not match any known routes: {}", path));

  hptr->set_resource_type(mime_type);
  return hptr;
}
