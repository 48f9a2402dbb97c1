/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#ifndef PROCESS_REQUEST_HPP
#define PROCESS_REQUEST_HPP

#include "timebanner/handler.hpp"
#include "timebanner/request.hpp"
#include "timebanner/routes.hpp"

/**
 * process a single request. http errors are reported to the client, any
 * other exception is reported as a 500 and then re-thrown.
 */
void process_request(request &req, const routes &route,
                     const service_context &ctx);

#endif /* PROCESS_REQUEST_HPP */
