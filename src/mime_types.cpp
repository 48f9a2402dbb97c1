/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/mime_types.hpp"
#include "timebanner/util.hpp"

#include <stdexcept>


namespace mime {
std::string to_string(type t) {
  switch (t) {
  case type::text_plain:
    return "text/plain";
  case type::application_json:
    return "application/json";
  case type::image_svg:
    return "image/svg+xml";
  case type::image_png:
    return "image/png";
  default:
    throw std::runtime_error("No string conversion for unspecified MIME type.");
  }
}

type from_extension(std::string_view ext) {

  if (iequals(ext, "svg")) {
    return type::image_svg;
  } else if (iequals(ext, "png")) {
    return type::image_png;
  }

  return type::unspecified_type;
}
}
