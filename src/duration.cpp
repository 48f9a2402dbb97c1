/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/duration.hpp"
#include "timebanner/parse_error.hpp"
#include "timebanner/util.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <optional>

#include <fmt/core.h>

namespace timebanner {

namespace {

using std::chrono::milliseconds;

enum unit_index : std::size_t { year, month, week, day, hour, minute, second, unit_count };

struct unit_group {
  std::string_view name;
  // longest spelling first, so that "mins" isn't read as "m" + "ins".
  std::array<std::string_view, 5> spellings;
};

constexpr std::array<unit_group, unit_count> unit_groups = {{
  {"year",   {"years", "year", "yrs", "yr", "y"}},
  {"month",  {"months", "month", "mon"}},
  {"week",   {"weeks", "week", "wks", "wk", "w"}},
  {"day",    {"days", "day", "d"}},
  {"hour",   {"hours", "hour", "hrs", "hr", "h"}},
  {"minute", {"minutes", "minute", "mins", "min", "m"}},
  {"second", {"seconds", "second", "secs", "sec", "s"}}
}};

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/**
 * Walks over the input, one unit group at a time.
 */
class duration_tokenizer {
public:
  explicit duration_tokenizer(std::string_view input) : m_input(input) {}

  bool at_end() const { return m_pos == m_input.size(); }

  std::size_t position() const { return m_pos; }

  std::string_view remaining() const { return m_input.substr(m_pos); }

  void skip_whitespace() {
    while (!at_end() && is_space(m_input[m_pos]))
      ++m_pos;
  }

  std::optional<char> take_sign() {
    if (!at_end() && (m_input[m_pos] == '+' || m_input[m_pos] == '-'))
      return m_input[m_pos++];
    return {};
  }

  // reads "<digits>[ ]<unit>" for the given group. on failure nothing is
  // consumed, leaving the text for the groups which follow.
  std::optional<std::string_view> take_group(const unit_group &group) {
    const auto start = m_pos;
    auto pos = m_pos;

    while (pos < m_input.size() && is_ascii_digit(m_input[pos]))
      ++pos;

    if (pos == start)
      return {};

    const auto digits = m_input.substr(start, pos - start);

    // a single whitespace character may separate the number and unit
    if (pos < m_input.size() && is_space(m_input[pos]))
      ++pos;

    const auto rest = m_input.substr(pos);
    for (auto spelling : group.spellings) {
      if (!spelling.empty() && rest.starts_with(spelling)) {
        m_pos = pos + spelling.size();
        skip_whitespace();
        return digits;
      }
    }

    return {};
  }

private:
  std::string_view m_input;
  std::size_t m_pos{0};
};

std::int64_t parse_count(std::string_view raw, const unit_group &group) {
  std::int64_t value{};
  auto [_, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  if (ec == std::errc::result_out_of_range)
    throw parse_error(fmt::format("Could not parse {} from {} (number too large)", group.name, raw),
                      parse_error::kind::out_of_range);
  if (ec != std::errc())
    throw parse_error(fmt::format("Could not parse {} from {}", group.name, raw));
  return value;
}

milliseconds checked_multiply(std::int64_t count, milliseconds unit, std::string_view input) {
  const auto result = multiply_int64(count, unit.count());
  if (!result)
    throw parse_error(fmt::format("Duration '{}' is out of range", input),
                      parse_error::kind::out_of_range);
  return milliseconds{*result};
}

milliseconds checked_add(milliseconds a, milliseconds b, std::string_view input) {
  const auto result = add_int64(a.count(), b.count());
  if (!result)
    throw parse_error(fmt::format("Duration '{}' is out of range", input),
                      parse_error::kind::out_of_range);
  return milliseconds{*result};
}

milliseconds unit_length(std::size_t index) {
  using namespace std::chrono;
  switch (index) {
  case year:   return duration_cast<milliseconds>(days{365});
  case month:  return average_month;
  case week:   return duration_cast<milliseconds>(weeks{1});
  case day:    return duration_cast<milliseconds>(days{1});
  case hour:   return duration_cast<milliseconds>(hours{1});
  case minute: return duration_cast<milliseconds>(minutes{1});
  default:     return duration_cast<milliseconds>(seconds{1});
  }
}

} // anonymous namespace

milliseconds parse_duration(std::string_view input) {

  duration_tokenizer tokens(input);

  tokens.skip_whitespace();
  if (tokens.at_end())
    return milliseconds::zero();

  const auto sign = tokens.take_sign();

  std::array<std::optional<std::string_view>, unit_count> raw_counts;
  bool found_unit = false;

  for (std::size_t i = 0; i < unit_count; ++i) {
    raw_counts[i] = tokens.take_group(unit_groups[i]);
    found_unit = found_unit || raw_counts[i].has_value();
  }

  if (!tokens.at_end()) {
    throw parse_error(fmt::format(
        "Could not parse duration '{}': unexpected '{}' at position {}, expected "
        "[+-] followed by units in the order years, months, weeks, days, hours, "
        "minutes, seconds", input, tokens.remaining(), tokens.position()));
  }

  if (!found_unit) {
    throw parse_error(fmt::format("Could not parse duration '{}': no units given", input));
  }

  milliseconds value = milliseconds::zero();

  for (std::size_t i = 0; i < unit_count; ++i) {
    if (!raw_counts[i])
      continue;

    const auto count = parse_count(*raw_counts[i], unit_groups[i]);
    value = checked_add(value, checked_multiply(count, unit_length(i), input), input);

    if (i == year && count > 0) {
      value = checked_add(value,
                          checked_multiply(count, std::chrono::duration_cast<milliseconds>(leap_compensation), input),
                          input);
    }
  }

  // the sign applies to the whole duration, never to a single unit
  if (sign == '-')
    value = -value;

  return value;
}

} // namespace timebanner
