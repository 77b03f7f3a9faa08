/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include <pqxx/pqxx>
#include <iostream>

#include <boost/program_options.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <fstream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

using namespace std::chrono_literals;

#include "authgate/logger.hpp"
#include "authgate/routes.hpp"
#include "authgate/backend.hpp"
#include "authgate/fcgi_request.hpp"
#include "authgate/options.hpp"
#include "authgate/process_request.hpp"
#include "authgate/pwd/hash_worker_pool.hpp"
#include "authgate/pwd/password_hasher.hpp"
#include "authgate/token.hpp"
#include "authgate/backend/apidb/apidb.hpp"


namespace po = boost::program_options;

namespace {

/**
 * global flags set by signal handlers.
 */
std::atomic<bool> terminate_requested = false;
std::atomic<bool> reload_requested = false;

static_assert(std::atomic<bool>::is_always_lock_free);

/**
 * SIGTERM handler.
 */
void terminate(int) {
  terminate_requested = true;
}

/**
 * SIGHUP handler.
 */
void reload(int) {
  reload_requested = true;
}

/**
 * parse the command line, environment and config file for options.
 */
void get_options(int argc, char **argv, po::variables_map &options) {
  po::options_description desc(PACKAGE_STRING ": Allowed options");

  // clang-format off
  desc.add_options()
    ("help", "display this help and exit")
    ("daemon", "run as a daemon")
    ("instances", po::value<int>()->default_value(5), "number of daemon instances to run")
    ("pidfile", po::value<std::string>(), "file to write pid to")
    ("logfile", po::value<std::string>(), "file to write log messages to, - for stderr")
    ("port", po::value<int>(), "FCGI port number (e.g. 8000) to listen on")
    ("socket", po::value<std::string>(), "FCGI port number (e.g. :8000, or 127.0.0.1:8000) or UNIX domain socket to listen on")
    ("configfile", po::value<std::string>(), "Config file")
    ;
  // clang-format on

  po::options_description secrets("Secrets");

  // clang-format off
  secrets.add_options()
    ("pwd-key", po::value<std::string>(), "password hashing key, 64 bytes base64url (see authgate-gen-key)")
    ("token-key", po::value<std::string>(), "token signing key, 64 bytes base64url (see authgate-gen-key)")
    ;
  // clang-format on

  po::options_description expert("Expert settings");

  // clang-format off
  expert.add_options()
    ("token-duration-sec", po::value<double>(), "lifetime of a session token in seconds")
    ("hash-workers", po::value<int>(), "number of password hashing threads")
    ("hash-queue-max", po::value<int>(), "max number of password hashing jobs queued or running")
    ("hash-timeout", po::value<long>(), "max time to wait for a password hashing job (in ms)")
    ("max-payload", po::value<long>(), "max size of HTTP payload allowed (in bytes)")
    ("cors-origin", po::value<std::vector<std::string> >()->composing(),
     "origin allowed to make credentialed cross-origin calls, may be repeated")
    ;
  // clang-format on

  desc.add(secrets);
  desc.add(expert);

  // add the backend options to the options description
  setup_backend_options(desc);

  po::store(po::parse_command_line(argc, argv, desc), options);

  // Show help after parsing command line parameters
  if (options.count("help")) {
    std::cout << desc << std::endl;
    exit(0);
  }

  po::store(po::parse_environment(desc,
    [&desc](const std::string &name) {
          std::string option;
          // convert an environment variable name to an option name
          if (name.starts_with("AUTHGATE_")) {
            std::transform(name.begin() + 9, name.end(),
                           std::back_inserter(option),
                           [](unsigned char c) {
                           return c == '_' ? '-' : std::tolower(c);
                   });
            for (const auto &d : desc.options()) {
              if (d->long_name() == option)
                return option;
            }
            std::cout << "Ignoring unknown environment variable: " << name << std::endl;
          }
          return std::string("");
        }), options);

  if (options.count("configfile")) {
    auto config_fname = options["configfile"].as<std::string>();
    std::ifstream ifs(config_fname.c_str());
    if(ifs.fail()) {
       throw std::runtime_error("Error opening config file: " + config_fname);
    }
    po::store(po::parse_config_file(ifs, desc), options);
  }

  po::notify(options);

  if (options.count("daemon") != 0 && options.count("socket") == 0 && options.count("port") == 0) {
    throw std::runtime_error("an FCGI port number or UNIX socket is required in daemon mode");
  }
}

/**
 * loop processing fastcgi requests until we are asked to stop by
 * somebody sending us a TERM signal.
 */
void process_requests(int socket, const po::variables_map &options,
                      const auth_settings_base &settings) {
  // open any log file
  if (options.count("logfile")) {
    logger::initialise(options["logfile"].as<std::string>());
  }

  // hashing threads are started here, after any fork.
  pwd::hash_worker_pool pool(settings.get_hash_workers(),
                             settings.get_hash_queue_max(),
                             settings.get_hash_timeout());
  pwd::password_hasher hasher(settings, pool);
  token::token_signer signer(settings);
  auth_services services{hasher, signer, settings.get_cors_origins()};

  // create the routes map (from URIs to handlers)
  routes route;

  // create the request object (persists over several calls)
  fcgi_request req(socket, std::chrono::system_clock::time_point(),
                   settings.get_payload_max_size());

  // create a factory for user stores - the mechanism for actually
  // getting at the users table.
  auto factory = create_backend(options);

  logger::message(fmt::format("Initialised {} with {:d} hashing threads",
                              PACKAGE_STRING, settings.get_hash_workers()));

  // enter the main loop
  while (!terminate_requested) {
    // process any reload request
    if (reload_requested) {
      if (options.count("logfile")) {
        logger::initialise(options["logfile"].as<std::string>());
      }

      reload_requested = false;
    }

    // get the next request
    if (req.accept_r() >= 0) {
      std::chrono::system_clock::time_point now(std::chrono::system_clock::now());
      req.set_current_time(now);
      process_request(req, route, *factory, services);
    }
  }

  // finish up - dispose of the resources
  req.dispose();
  pool.shutdown();
}

void install_signal_handlers() {
  struct sigaction sa{};

  // install a SIGTERM handler
  sa.sa_handler = terminate;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  if (sigaction(SIGTERM, &sa, nullptr) < 0) {
    throw std::runtime_error("sigaction failed");
  }

  // install a SIGHUP handler
  sa.sa_handler = reload;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  if (sigaction(SIGHUP, &sa, nullptr) < 0) {
    throw std::runtime_error("sigaction failed");
  }
}

/**
 * make the process into a daemon by detaching from the console.
 */
void daemonise() {
  pid_t pid = 0;

  // fork to make sure we aren't a session leader
  if ((pid = fork()) < 0) {
    throw std::runtime_error("fork failed.");
  } else if (pid > 0) {
    exit(0);
  }

  // start a new session
  if (setsid() < 0) {
    throw std::runtime_error("setsid failed");
  }

  install_signal_handlers();

  // close standard descriptors
  close(0);
  close(1);
  close(2);
}

void write_pidfile(const po::variables_map &options) {
  if (options.count("pidfile")) {
    std::ofstream pidfile(options["pidfile"].as<std::string>().c_str());
    pidfile << getpid() << std::endl;
  }
}

void remove_pidfile(const po::variables_map &options) {
  if (options.count("pidfile")) {
    remove(options["pidfile"].as<std::string>().c_str());
  }
}

void daemon_mode(const po::variables_map &options, int socket,
                 const auth_settings_base &settings)
{
  size_t instances = 0;

  {
    int opt_instances = options["instances"].as<int>();
    if (opt_instances > 0) {
      instances = opt_instances;
    } else {
      throw std::runtime_error(
          "Number of instances must be strictly positive.");
    }
  }

  bool children_terminated = false;
  std::set<pid_t> children;

  // make ourselves into a daemon
  daemonise();

  write_pidfile(options);

  // loop until we have been asked to stop and have no more children
  while (!terminate_requested || !children.empty()) {
    pid_t pid{};

    // start more children if we don't have enough
    while (!terminate_requested && (children.size() < instances)) {
      if ((pid = fork()) < 0) {
        throw std::runtime_error("fork failed.");
      } else if (pid == 0) {
        const auto start = std::chrono::steady_clock::now();
        try {
          process_requests(socket, options, settings);
        } catch (const std::exception &e) {
          logger::message(fmt::format("Worker exiting after error: {}", e.what()));
          // don't restart a failing worker in a tight loop
          const auto end = std::chrono::steady_clock::now();
          const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
          if (elapsed < 1000ms) {
            std::this_thread::sleep_for(1000ms - elapsed);
          }
          throw;
        }
        exit(0);
      }

      children.insert(pid);
    }

    // wait for a child to exit
    if ((pid = wait(nullptr)) >= 0) {
      children.erase(pid);
    } else if (errno != EINTR) {
      throw std::runtime_error("wait failed.");
    }

    // pass on any termination request to our children
    if (terminate_requested && !children_terminated) {
      for (auto child : children) { kill(child, SIGTERM); }

      children_terminated = true;
    }

    // pass on any reload request to our children
    if (reload_requested) {
      for (auto child : children) { kill(child, SIGHUP); }

      reload_requested = false;
    }
  }

  remove_pidfile(options);
}

void non_daemon_mode(const po::variables_map &options, int socket,
                     const auth_settings_base &settings)
{
  if (options.count("instances") && !options["instances"].defaulted()) {
    std::cerr << "[WARN] The --instances parameter is ignored in non-daemon mode, running as single process only.\n"
                 "[WARN] If the process terminates, it must be restarted externally.\n";
  }

  install_signal_handlers();

  write_pidfile(options);

  process_requests(socket, options, settings);

  remove_pidfile(options);
}

int init_socket(const po::variables_map &options)
{
  int socket = 0;

  if (options.count("socket")) {
    if ((socket = fcgi_request::open_socket(options["socket"].as<std::string>(), 5)) < 0) {
      throw std::runtime_error("Couldn't open FCGX socket.");
    }
  } else if (options.count("port")) {
    auto sock_str = fmt::format(":{:d}", options["port"].as<int>());
    if ((socket = fcgi_request::open_socket(sock_str, 5)) < 0) {
      throw std::runtime_error("Couldn't open FCGX socket (from port).");
    }
  }
  return socket;
}

} // anonymous namespace


int main(int argc, char **argv) {
  try {
    po::variables_map options;

    // set up the apidb backend
    register_backend(make_apidb_backend());

    // get options
    get_options(argc, argv, options);

    // a missing or malformed secret stops the process here.
    const auth_settings_via_options settings(options);

    // get the socket to use
    auto socket = init_socket(options);

    // are we supposed to run as a daemon?
    if (options.count("daemon")) {
      daemon_mode(options, socket, settings);
    } else {
      non_daemon_mode(options, socket, settings);
    }
  } catch (const po::error & e) {
    std::cerr << "Error: " << e.what() << "\n(\"authgate --help\" for help)" << std::endl;
    return 1;

  } catch (const pqxx::sql_error &er) {
    logger::message(er.what());
    // Catch-all for query related postgres exceptions
    std::cerr << "Error: " << er.what() << std::endl
              << "Caused by: " << er.query() << std::endl;
    return 1;

  } catch (const std::exception &e) {
    logger::message(e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
