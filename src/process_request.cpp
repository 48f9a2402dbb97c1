/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/process_request.hpp"
#include "timebanner/http.hpp"
#include "timebanner/logger.hpp"
#include "timebanner/output_buffer.hpp"
#include "timebanner/util.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>

#include <fmt/core.h>

namespace {

// longest message repeated in the Error header
constexpr std::size_t error_header_length = 250;

// banners are meant to be embedded anywhere
void add_common_headers(request &req, const std::string &cache_control) {
  req.add_header("Cache-Control", cache_control)
     .add_header("Access-Control-Allow-Origin", "*");
}

void respond_not_found(request &req) {
  req.status(404)
     .add_header("Content-Length", "0");
  add_common_headers(req, "no-cache");
  req.finish();
}

void respond_not_allowed(request &req, http::method allowed) {
  req.status(405)
     .add_header("Allow", http::list_methods(allowed))
     .add_header("Content-Length", "0");
  add_common_headers(req, "no-cache");
  req.finish();
}

// answers a CORS preflight, or a plain enquiry about the methods.
void respond_options(request &req, const handler &handler) {
  const auto methods = http::list_methods(handler.allowed_methods());

  req.status(204)
     .add_header("Allow", methods)
     .add_header("Access-Control-Allow-Methods", methods)
     .add_header("Access-Control-Max-Age", "86400");

  if (const char *headers = req.get_param("HTTP_ACCESS_CONTROL_REQUEST_HEADERS"))
    req.add_header("Access-Control-Allow-Headers", headers);

  add_common_headers(req, "no-cache");
  req.finish();
}

void respond_error(const http::exception &e, request &req) {
  logger::message(fmt::format("Returning with http error {} with reason {}", e.code(), e.what()));

  const char *format = req.get_param("HTTP_X_ERROR_FORMAT");
  const bool as_json = format != nullptr && iequals(format, "json");

  std::string body;
  if (as_json) {
    body = fmt::format(R"({{"code":{},"message":{}}})", e.code(), escape(e.what()));
    req.status(e.code())
       .add_header("Content-Type", "application/json; charset=utf-8");
  } else {
    body = e.what();
    std::string summary = body.substr(0, error_header_length);
    std::replace(summary.begin(), summary.end(), '\n', ' ');

    req.status(e.code())
       .add_header("Content-Type", "text/plain")
       .add_header("Error", summary);
  }

  req.add_header("Content-Length", std::to_string(body.size()));
  add_common_headers(req, "no-cache");

  if (req.body().write(body) < 0)
    logger::message("Couldn't write the error response, the client has probably gone");

  req.finish();
}

// redirects have no body, so nothing is encoded for them.
bool has_body(const responder &responder) {
  return responder.status() < 300 || responder.status() >= 400;
}

http::content_coding response_coding(const request &req) {
  const char *accept_encoding = req.get_param("HTTP_ACCEPT_ENCODING");
  if (accept_encoding == nullptr)
    return http::content_coding::identity;
  return http::choose_encoding(accept_encoding);
}

void write_head(request &req, const responder &responder,
                std::optional<http::content_coding> coding) {
  req.status(responder.status());

  if (coding) {
    req.add_header("Content-Type", fmt::format("{}; charset=utf-8",
                                               mime::to_string(responder.resource_type())))
       .add_header("Content-Encoding", http::to_string(*coding));
  } else {
    req.add_header("Content-Length", "0");
  }

  add_common_headers(req, responder.cache_control());

  for (const auto &[key, value] : responder.extra_response_headers())
    req.add_header(key, value);
}

// returns the number of body bytes written.
int serve(request &req, const handler &handler, const service_context &ctx,
          http::method method) {
  // the expression is resolved here, so a bad one fails before any output
  const responder_ptr_t responder = handler.responder(ctx);

  if (!has_body(*responder)) {
    write_head(req, *responder, std::nullopt);
    req.finish();
    return 0;
  }

  const auto coding = response_coding(req);
  write_head(req, *responder, coding);

  if (method == http::method::HEAD) {
    req.finish();
    return 0;
  }

  try {
    auto out = http::encoded_buffer(coding, req.body());
    responder->write(*out);

    // the encoder may still be holding on to the end of the body
    if (out->close() < 0)
      throw write_error("Couldn't complete the response body");

    req.finish();
    return out->written();

  } catch (const write_error &e) {
    // the client has most likely gone away, so go on to the next request
    logger::message(fmt::format("Caught write error, aborting request: {}", e.what()));
  }

  return 0;
}

} // anonymous namespace

void process_request(request &req, const routes &route,
                     const service_context &ctx) {
  try {
    const auto ip = req.param("REMOTE_ADDR", "");
    const auto method = http::parse_method(req.param("REQUEST_METHOD"));

    auto handler = route(req);

    if (!method || !handler->allows_method(*method)) {
      respond_not_allowed(req, handler->allowed_methods());
      return;
    }

    if (*method == http::method::OPTIONS) {
      respond_options(req, *handler);
      return;
    }

    const auto name = handler->log_name();
    logger::message(fmt::format("Started {} request for {} from {}",
                                http::list_methods(*method), name, ip));

    const auto start = std::chrono::steady_clock::now();
    const int bytes = serve(req, *handler, ctx, *method);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    // logged last, so that a failed request isn't also reported as completed
    logger::message(fmt::format("Completed request for {} from {} in {:d} ms returning {:d} bytes",
                                name, ip, elapsed.count(), bytes));

  } catch (const http::not_found &) {
    respond_not_found(req);

  } catch (const http::method_not_allowed &e) {
    respond_not_allowed(req, e.allowed_methods);

  } catch (const http::exception &e) {
    respond_error(e, req);

  } catch (const std::exception &e) {
    respond_error(http::server_error(e.what()), req);

    // the process loop decides what to do with anything unexpected
    throw;
  }
}
