/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef UTIL_HPP
#define UTIL_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <ranges>
#include <type_traits>
#include <vector>

inline char tolower_ascii(char c) {

  if (c >= 'A' && c <= 'Z') {
    return c + ('a' - 'A');
  }
  return c;
}

inline bool ichar_equals(char a, char b) {
  return a == b ||
      tolower_ascii(static_cast<unsigned char>(a)) ==
      tolower_ascii(static_cast<unsigned char>(b));
}

// Case insensitive string comparison
inline bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::ranges::equal(a, b, ichar_equals);
}

// a + b, or nothing if the sum doesn't fit
inline std::optional<std::int64_t> add_int64(std::int64_t a, std::int64_t b) {
  constexpr auto max = std::numeric_limits<std::int64_t>::max();
  constexpr auto min = std::numeric_limits<std::int64_t>::min();

  if ((b > 0 && a > max - b) || (b < 0 && a < min - b))
    return {};
  return a + b;
}

// a * b, or nothing if the product doesn't fit
inline std::optional<std::int64_t> multiply_int64(std::int64_t a, std::int64_t b) {
  constexpr auto max = std::numeric_limits<std::int64_t>::max();
  constexpr auto min = std::numeric_limits<std::int64_t>::min();

  if (a == 0 || b == 0)
    return 0;

  const bool overflow = a > 0 ? (b > 0 ? a > max / b : b < min / a)
                              : (b > 0 ? a < min / b : a < max / b);
  if (overflow)
    return {};
  return a * b;
}

inline bool is_ascii_digit(char c) { return c >= '0' && c <= '9'; }

inline bool is_ascii_alpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool all_digits(std::string_view s) {
  return !s.empty() && std::ranges::all_of(s, is_ascii_digit);
}

inline bool all_alpha(std::string_view s) {
  return !s.empty() && std::ranges::all_of(s, is_ascii_alpha);
}

template <typename T>
concept StringLike = std::is_same_v<std::remove_cvref_t<T>, std::string> ||
                     std::is_same_v<std::remove_cvref_t<T>, std::string_view>;

template <StringLike T>
inline T trim(T str) {
  auto start = str.find_first_not_of(" \t\n\r");
  if (start == T::npos)
      return {};
  auto end = str.find_last_not_of(" \t\n\r");
  return str.substr(start, end - start + 1);
}

template <StringLike T>
inline std::vector<T> split(T str, char delim) {
    auto split_result = str | std::ranges::views::split(delim);

    std::vector<T> result;
    for (auto&& part : split_result) {
        result.push_back(T(part.begin(), part.end()));
    }

    return result;
}

// quote a string for use as a JSON string value
inline std::string escape(std::string_view input) {

  std::string result;
  result.reserve(input.size() + 2);

  result += '"';

  for (char c : input) {
    if (c == '"' || c == '\\') {
      result += '\\';
      result += c;
    } else if (c == '\n') {
      result += "\\n";
    } else if (static_cast<unsigned char>(c) < 0x20) {
      result += ' ';
    } else {
      result += c;
    }
  }

  result += '"';

  return result;
}

#endif
