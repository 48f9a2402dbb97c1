/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef ROUTER_HPP
#define ROUTER_HPP

#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace match {

template<typename ... input_t>
using tuple_cat_t = decltype(std::tuple_cat(std::declval<input_t>()...));

// iterates over the split up parts of the item being matched.
using part_iterator = std::vector<std::string_view>::const_iterator;

/* the AST classes all have a type match_type which indicates the tuple
 * they return on a successful match, and a match() method which returns
 * that tuple plus a flag which is true on failure.
 */
struct match_string;
struct match_expression;
struct match_begin;

template <typename LeftType, typename RightType> struct match_and;

/**
 * maps the '/' operator onto the construction of the AST objects, so that
 * routes read like paths (e.g: root_ / "relative" / expression_).
 */
template <typename Self> struct ops {
  match_and<Self, match_string> operator/(const match_string &rhs) const {
    return match_and<Self, match_string>(*static_cast<const Self *>(this), rhs);
  }
  match_and<Self, match_expression> operator/(const match_expression &rhs) const {
    return match_and<Self, match_expression>(*static_cast<const Self *>(this), rhs);
  }
};

/**
 * effectively a cons cell for sequencing matches.
 */
template <typename LeftType, typename RightType>
struct match_and : public ops<match_and<LeftType, RightType> > {

  using match_type = tuple_cat_t<typename LeftType::match_type, typename RightType::match_type>;

  match_and(const LeftType &l, const RightType &r) : lhs(l), rhs(r) {}

  std::pair<match_type, bool> match(part_iterator &begin, const part_iterator &end) const {
    auto [ lval, lerror ] = lhs.match(begin, end);
    if (lerror)
      return {match_type(), true};
    auto [ rval, rerror ] = rhs.match(begin, end);
    if (rerror)
      return {match_type(), true};
    return {std::tuple_cat(lval, rval), false};
  }

private:
  LeftType lhs;
  RightType rhs;
};

/**
 * matches a literal path segment.
 */
struct match_string : public ops<match_string> {
  using match_type = std::tuple<>;

  // implicit so that string literals can be used directly in routes.
  match_string(const char *s);

  match_string(const match_string &m) = default;

  std::pair<match_type, bool> match(part_iterator &begin, const part_iterator &end) const noexcept;

private:
  std::string_view str;
};

/**
 * matches any non-empty path segment, returning it %-decoded as a
 * temporal expression.
 */
struct match_expression : public ops<match_expression> {
  using match_type = std::tuple<std::string>;
  match_expression() = default;
  std::pair<match_type, bool> match(part_iterator &begin, const part_iterator &end) const;
};

/**
 * null match, which matches anything. anchors the expression with the
 * correct type.
 */
struct match_begin : public ops<match_begin> {
  using match_type = std::tuple<>;
  match_begin() = default;
  inline std::pair<match_type, bool> match(const part_iterator&, const part_iterator&) const noexcept{
    return {match_type(), false};
  }
};

// match items, given nicer names so that expressions are easier to read.
static constexpr match_begin root_;
static constexpr match_expression expression_;
}

#endif /* ROUTER_HPP */
