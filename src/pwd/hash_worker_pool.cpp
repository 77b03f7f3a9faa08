/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/pwd/hash_worker_pool.hpp"
#include "authgate/logger.hpp"

#include <fmt/core.h>


namespace pwd {

hash_worker_pool::hash_worker_pool(std::size_t threads, std::size_t max_in_flight,
                                   std::chrono::milliseconds timeout)
  : m_pool(threads),
    m_max_in_flight(max_in_flight),
    m_timeout(timeout) {

  if (threads == 0 || max_in_flight == 0)
    throw std::invalid_argument("hash worker pool needs at least one thread and one slot");
}

hash_worker_pool::~hash_worker_pool() {
  shutdown();
}

void hash_worker_pool::shutdown() {
  m_stopped.store(true);
  m_pool.join();
}

void hash_worker_pool::acquire_slot() {
  auto current = m_in_flight.load();
  do {
    if (current >= m_max_in_flight)
      reject(fmt::format("hash worker pool is saturated, {} jobs in flight", current));
  } while (!m_in_flight.compare_exchange_weak(current, current + 1));
}

void hash_worker_pool::reject(const std::string &reason) {
  logger::message("HASH_POOL", reason);
  throw dispatch_error(reason);
}

void hash_worker_pool::release_slot() noexcept {
  m_in_flight.fetch_sub(1);
}

} // namespace pwd
