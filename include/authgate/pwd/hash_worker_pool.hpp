/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef PWD_HASH_WORKER_POOL_HPP
#define PWD_HASH_WORKER_POOL_HPP

#include "authgate/pwd/errors.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace pwd {

/**
 * Fixed set of threads for password hashing, apart from the threads
 * serving requests.
 *
 * run() refuses new work once max_in_flight jobs are queued or running,
 * and stops waiting for a job after the timeout. A job which timed out
 * keeps its slot until it has really finished.
 */
class hash_worker_pool {
public:
  hash_worker_pool(std::size_t threads, std::size_t max_in_flight,
                   std::chrono::milliseconds timeout);
  ~hash_worker_pool();

  hash_worker_pool(const hash_worker_pool &) = delete;
  hash_worker_pool& operator=(const hash_worker_pool &) = delete;

  // runs job on a worker and waits for its result. exceptions thrown by
  // the job are rethrown here. the job must own everything it uses.
  template <typename F>
  std::invoke_result_t<F> run(F &&job) {
    using result_t = std::invoke_result_t<F>;

    if (m_stopped.load())
      reject("hash worker pool is shut down");

    acquire_slot();

    // the slot is freed before the result is published, so a caller
    // woken by the result can submit again straight away.
    auto done = std::make_shared<std::promise<result_t>>();
    auto result = done->get_future();

    boost::asio::post(m_pool, [this, done, job = std::forward<F>(job)]() mutable {
      bool released = false;
      try {
        if constexpr (std::is_void_v<result_t>) {
          job();
          release_slot();
          released = true;
          done->set_value();
        } else {
          result_t value = job();
          release_slot();
          released = true;
          done->set_value(std::move(value));
        }
      } catch (...) {
        if (!released)
          release_slot();
        done->set_exception(std::current_exception());
      }
    });

    if (result.wait_for(m_timeout) != std::future_status::ready)
      reject("hashing job timed out");

    return result.get();
  }

  // stops accepting work and waits for the running jobs.
  void shutdown();

  [[nodiscard]] std::size_t in_flight() const { return m_in_flight.load(); }

private:
  // logs the reason and throws dispatch_error
  [[noreturn]] static void reject(const std::string &reason);
  void acquire_slot();
  void release_slot() noexcept;

  boost::asio::thread_pool m_pool;
  const std::size_t m_max_in_flight;
  const std::chrono::milliseconds m_timeout;
  std::atomic<std::size_t> m_in_flight{0};
  std::atomic<bool> m_stopped{false};
};

} // namespace pwd

#endif /* PWD_HASH_WORKER_POOL_HPP */
