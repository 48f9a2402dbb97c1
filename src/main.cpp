/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/abbreviation_table.hpp"
#include "timebanner/fcgi_request.hpp"
#include "timebanner/handler.hpp"
#include "timebanner/logger.hpp"
#include "timebanner/options.hpp"
#include "timebanner/process_request.hpp"
#include "timebanner/routes.hpp"

#include <atomic>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <fmt/core.h>

namespace po = boost::program_options;

namespace {

constexpr std::string_view environment_prefix = "TIMEBANNER_";
constexpr int socket_backlog = 5;

// set from the signal handlers, checked between requests
std::atomic<bool> stop_requested = false;
std::atomic<bool> reopen_log_requested = false;

static_assert(std::atomic<bool>::is_always_lock_free);

void on_sigterm(int) { stop_requested = true; }

void on_sighup(int) { reopen_log_requested = true; }

void install_signal_handler(int signal, void (*handler)(int)) {
  struct sigaction sa{};
  sa.sa_handler = handler;
  sigemptyset(&sa.sa_mask);

  // no SA_RESTART, so a signal interrupts the wait for the next request
  if (sigaction(signal, &sa, nullptr) < 0)
    throw std::runtime_error(fmt::format("Couldn't install the handler for signal {}", signal));
}

po::options_description describe_options() {
  po::options_description service(PACKAGE_STRING ": Allowed options");

  // clang-format off
  service.add_options()
    ("help", "display this help and exit")
    ("logfile", po::value<std::string>(), "file to write log messages to")
    ("socket", po::value<std::string>(), "FCGI port number (e.g. :8000, or 127.0.0.1:8000) or UNIX domain socket to listen on")
    ("port", po::value<int>(), "FCGI port number to listen on, for configurations which predate --socket")
    ("configfile", po::value<std::string>(), "Config file")
    ;
  // clang-format on

  po::options_description resolver("Time expression settings");

  // clang-format off
  resolver.add_options()
    ("abbreviations", po::value<std::string>(), "tab separated timezone abbreviation file")
    ("date-order", po::value<std::string>(), "order of numeric date fields: ymd, mdy or dmy")
    ("strict", po::value<bool>(), "reject timezone abbreviations with more than one meaning")
    ("max-age", po::value<long>(), "Cache-Control max-age (in seconds) for absolute banners")
    ;
  // clang-format on

  service.add(resolver);
  return service;
}

// TIMEBANNER_DATE_ORDER sets --date-order. returns an empty string for
// variables which aren't ours.
std::string option_for_variable(const po::options_description &desc, const std::string &variable) {
  if (!variable.starts_with(environment_prefix))
    return {};

  std::string option;
  for (char c : variable.substr(environment_prefix.size()))
    option += c == '_' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  if (desc.find_nothrow(option, false) == nullptr) {
    std::cerr << "Ignoring unknown environment variable: " << variable << std::endl;
    return {};
  }
  return option;
}

// command line first, then the environment, then any config file.
po::variables_map read_options(int argc, char **argv) {
  const auto desc = describe_options();
  po::variables_map options;

  po::store(po::parse_command_line(argc, argv, desc), options);

  if (options.count("help")) {
    std::cout << desc << std::endl;
    std::exit(0);
  }

  po::store(po::parse_environment(desc,
      [&desc](const std::string &variable) { return option_for_variable(desc, variable); }),
    options);

  if (options.count("configfile")) {
    const auto filename = options["configfile"].as<std::string>();
    std::ifstream config(filename);
    if (config.fail())
      throw std::runtime_error("Error opening config file: " + filename);
    po::store(po::parse_config_file(config, desc), options);
  }

  po::notify(options);
  return options;
}

// with neither --socket nor --port, the web server is expected to have
// handed us the listening socket as stdin.
int listen_socket(const po::variables_map &options) {
  std::string address;
  if (options.count("socket"))
    address = options["socket"].as<std::string>();
  else if (options.count("port"))
    address = fmt::format(":{:d}", options["port"].as<int>());
  else
    return 0;

  const int socket = fcgi_request::open_socket(address, socket_backlog);
  if (socket < 0)
    throw std::runtime_error(fmt::format("Couldn't open FastCGI socket {}", address));
  return socket;
}

void open_log(const po::variables_map &options) {
  if (options.count("logfile"))
    logger::initialise(options["logfile"].as<std::string>());
}

void serve_requests(int socket, const po::variables_map &options,
                    const service_context &ctx) {
  const routes route;
  fcgi_request req(socket);

  logger::message("Initialised");

  while (!stop_requested) {
    if (reopen_log_requested) {
      open_log(options);
      reopen_log_requested = false;
    }

    if (!req.accept())
      continue;

    // the client has had its 500 by now, the process carries on with the
    // next request.
    try {
      process_request(req, route, ctx);
    } catch (const std::exception &e) {
      logger::message(fmt::format("Request failed: {}", e.what()));
    }
  }
}

} // anonymous namespace

int main(int argc, char **argv) {
  try {
    const auto options = read_options(argc, argv);
    const global_settings_via_options settings(options);

    open_log(options);

    // read once, then shared read-only by every request
    const auto table = timebanner::abbreviation_table::from_file(settings.get_abbreviations_file());

    const service_context ctx{
      timebanner::resolver_context{table, settings.get_resolver_config()},
      settings.get_max_age()};

    const int socket = listen_socket(options);

    install_signal_handler(SIGTERM, on_sigterm);
    install_signal_handler(SIGHUP, on_sighup);

    serve_requests(socket, options, ctx);

  } catch (const po::error &e) {
    std::cerr << "Error: " << e.what() << "\n(\"timebanner --help\" for help)" << std::endl;
    return 1;

  } catch (const std::exception &e) {
    logger::message(e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
