/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef MIME_TYPES_HPP
#define MIME_TYPES_HPP

#include <string>
#include <string_view>

/**
 * simple set of supported mime types.
 */
namespace mime {
enum class type {
  unspecified_type, // a "null" type, used to indicate no choice.
  text_plain,
  application_json,
  image_svg,
  image_png
};

std::string to_string(type);

// map a path extension ("svg", "PNG") to a type, case-insensitively.
// returns unspecified_type for anything unknown.
type from_extension(std::string_view);
}

#endif /* MIME_TYPES_HPP */
