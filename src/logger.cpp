/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <unistd.h>

#include <fmt/core.h>

#include "authgate/logger.hpp"

namespace logger {

namespace {

std::unique_ptr<std::ostream> file_stream;
std::ostream *stream = nullptr;
std::mutex stream_mutex;
pid_t pid;

}

void initialise(const std::string &filename) {
  std::lock_guard lock(stream_mutex);

  if (filename == "-") {
    file_stream.reset();
    stream = &std::cerr;
  } else {
    file_stream = std::make_unique<std::ofstream>(filename, std::ios_base::out | std::ios_base::app);
    stream = file_stream.get();
  }
  pid = getpid();
}

void message(std::string_view m) {
  // hashing workers log too, so writes are serialised
  std::lock_guard lock(stream_mutex);

  if (stream) {
    time_t now = time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    *stream << "[" << std::put_time(&tm, "%FT%T") << " #" << pid << "] " << m
            << std::endl;
  }
}

void message(std::string_view category, std::string_view m) {
  message(fmt::format("{:<12} - {}", category, m));
}

}
