/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/handler.hpp"

responder::responder(mime::type mt) : mime_type(mt) {}

mime::type responder::resource_type() const { return mime_type; }

int responder::status() const { return 200; }

http::headers_t responder::extra_response_headers() const { return {}; }

handler::handler(mime::type default_type,
                 http::method methods)
  : mime_type(default_type),
    m_allowed_methods(methods) {}

void handler::set_resource_type(mime::type mt) { mime_type = mt; }

mime::type handler::resource_type() const { return mime_type; }
