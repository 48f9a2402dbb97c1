/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/svg.hpp"
#include "timebanner/svg_writer.hpp"
#include "timebanner/utc_offset.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace timebanner {

using namespace std::chrono;

namespace {

struct text_unit {
  std::string_view name;
  std::int64_t length;  // seconds
};

constexpr std::array<text_unit, 7> text_units = {{
  {"year",   365 * 86400},
  {"month",  30 * 86400},
  {"week",   7 * 86400},
  {"day",    86400},
  {"hour",   3600},
  {"minute", 60},
  {"second", 1}
}};

constexpr const char *svg_namespace = "http://www.w3.org/2000/svg";
constexpr const char *foreground = "#24292f";
constexpr const char *background = "#f6f8fa";

constexpr int banner_height = 40;
// rough width of a glyph at the banner font size
constexpr int glyph_width = 11;
constexpr int banner_padding = 24;

std::size_t utf8_length(std::string_view s) {
  std::size_t length = 0;
  for (char c : s) {
    // count everything but continuation bytes
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
      ++length;
  }
  return length;
}

// a line from (32, y1) to (32, y2) turned clockwise about the centre of
// the face. the element is left open for the caller to finish.
void clock_line(svg_writer &svg, int y1, int y2, int width, const std::string &rotation) {
  svg.start("line");
  svg.attribute("x1", 32);
  svg.attribute("y1", y1);
  svg.attribute("x2", 32);
  svg.attribute("y2", y2);
  svg.attribute("stroke-width", width);
  svg.attribute("transform", fmt::format("rotate({} 32 32)", rotation));
}

// circle at the centre of the face, also left open.
void circle(svg_writer &svg, int r) {
  svg.start("circle");
  svg.attribute("cx", 32);
  svg.attribute("cy", 32);
  svg.attribute("r", r);
}

} // anonymous namespace

std::string relative_text(instant_t instant, instant_t now) {
  const auto difference = duration_cast<seconds>(instant - now).count();
  const auto magnitude = difference < 0 ? -difference : difference;

  if (magnitude < 1)
    return "now";

  for (const auto &unit : text_units) {
    if (magnitude < unit.length)
      continue;

    const auto count = magnitude / unit.length;
    const auto phrase = fmt::format("{} {}{}", count, unit.name, count == 1 ? "" : "s");
    return difference > 0 ? fmt::format("in {}", phrase) : fmt::format("{} ago", phrase);
  }

  return "now";
}

std::string absolute_text(instant_t instant, std::chrono::seconds offset,
                          std::string_view zone_label) {
  const auto local = floor<seconds>(instant) + offset;
  const auto day = floor<days>(local);
  const year_month_day date{day};
  const hh_mm_ss time{local - day};

  auto text = fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}{}",
                          static_cast<int>(date.year()),
                          static_cast<unsigned>(date.month()),
                          static_cast<unsigned>(date.day()),
                          time.hours().count(), time.minutes().count(),
                          time.seconds().count(), format_utc_offset(offset));

  if (!zone_label.empty())
    text += fmt::format(" {}", zone_label);

  return text;
}

void write_banner(output_buffer &out, const std::string &text) {
  const int width = banner_padding * 2 + glyph_width * static_cast<int>(utf8_length(text));

  svg_writer svg(out);

  svg.start("svg");
  svg.attribute("xmlns", svg_namespace);
  svg.attribute("width", width);
  svg.attribute("height", banner_height);
  svg.attribute("viewBox", fmt::format("0 0 {} {}", width, banner_height));
  svg.attribute("role", "img");
  svg.attribute("aria-label", text);

  svg.start("title");
  svg.text(text);
  svg.end();

  svg.start("rect");
  svg.attribute("width", width);
  svg.attribute("height", banner_height);
  svg.attribute("rx", 6);
  svg.attribute("fill", foreground);
  svg.end();

  svg.start("text");
  svg.attribute("x", width / 2);
  svg.attribute("y", banner_height / 2);
  svg.attribute("dominant-baseline", "central");
  svg.attribute("text-anchor", "middle");
  svg.attribute("font-family", "Verdana, DejaVu Sans, sans-serif");
  svg.attribute("font-size", 18);
  svg.attribute("fill", background);
  svg.text(text);
  svg.end();

  svg.end();
  svg.finish();
}

void write_clock(output_buffer &out, instant_t instant) {
  const auto since_midnight = floor<seconds>(instant) - floor<days>(instant);
  const hh_mm_ss time{since_midnight};

  const auto h = time.hours().count() % 12;
  const auto m = time.minutes().count();
  const auto s = time.seconds().count();

  const auto label = absolute_text(instant, std::chrono::seconds{0});

  svg_writer svg(out);

  svg.start("svg");
  svg.attribute("xmlns", svg_namespace);
  svg.attribute("width", 64);
  svg.attribute("height", 64);
  svg.attribute("viewBox", "0 0 64 64");
  svg.attribute("role", "img");
  svg.attribute("aria-label", label);

  svg.start("title");
  svg.text(label);
  svg.end();

  circle(svg, 30);
  svg.attribute("fill", background);
  svg.attribute("stroke", foreground);
  svg.attribute("stroke-width", 3);
  svg.end();

  svg.start("g");
  svg.attribute("stroke", foreground);
  svg.attribute("stroke-linecap", "round");

  // longer, heavier ticks on the quarter hours
  for (int i = 0; i < 12; ++i) {
    const bool quarter = i % 3 == 0;
    clock_line(svg, 5, quarter ? 10 : 8, quarter ? 2 : 1, std::to_string(i * 30));
    svg.end();
  }

  clock_line(svg, 32, 17, 4, fmt::format("{:.2f}", h * 30 + m * 0.5));
  svg.end();
  clock_line(svg, 32, 9, 3, fmt::format("{:.2f}", m * 6 + s * 0.1));
  svg.end();
  clock_line(svg, 36, 7, 1, std::to_string(s * 6));
  svg.attribute("stroke", "#cf222e");
  svg.end();

  svg.end();

  circle(svg, 2);
  svg.attribute("fill", foreground);
  svg.end();

  svg.end();
  svg.finish();
}

void write_svg(output_buffer &out, const resolved_instant &resolved, instant_t now) {
  switch (resolved.intent) {
  case display_intent::relative:
    write_banner(out, relative_text(resolved.instant, now));
    return;
  case display_intent::absolute:
    write_banner(out, absolute_text(resolved.instant, resolved.source_offset, resolved.zone_label));
    return;
  case display_intent::clock:
    write_clock(out, resolved.instant);
    return;
  }
  throw std::logic_error("Unknown display intent");
}

} // namespace timebanner
