/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/pwd/hash_worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

using namespace std::chrono_literals;
using pwd::hash_worker_pool;

TEST_CASE("jobs run on the pool and return their result", "[pool]") {
  hash_worker_pool pool(2, 4, 5000ms);

  const auto caller = std::this_thread::get_id();
  const auto worker = pool.run([]() { return std::this_thread::get_id(); });
  CHECK(worker != caller);

  CHECK(pool.run([]() { return std::string("done"); }) == "done");
  CHECK(pool.in_flight() == 0);
}

TEST_CASE("job exceptions reach the caller", "[pool]") {
  hash_worker_pool pool(1, 1, 5000ms);

  CHECK_THROWS_AS(pool.run([]() -> int { throw std::logic_error("boom"); }), std::logic_error);

  // the slot is free again
  CHECK(pool.run([]() { return 1; }) == 1);
}

TEST_CASE("a single slot is free as soon as the result arrives", "[pool]") {
  hash_worker_pool pool(1, 1, 5000ms);

  for (int i = 0; i < 500; ++i) {
    REQUIRE(pool.run([i]() { return i; }) == i);
    REQUIRE_THROWS_AS(pool.run([]() -> int { throw std::logic_error("boom"); }), std::logic_error);
  }
  CHECK(pool.in_flight() == 0);
}

TEST_CASE("a pool needs threads and slots", "[pool]") {
  CHECK_THROWS_AS(hash_worker_pool(1, 0, 1000ms), std::invalid_argument);
}

TEST_CASE("a full pool refuses work", "[pool]") {
  hash_worker_pool pool(1, 1, 5000ms);

  std::promise<void> release;
  auto released = release.get_future().share();
  std::atomic<bool> started{false};

  auto first = std::async(std::launch::async, [&]() {
    return pool.run([released, &started]() {
      started = true;
      released.wait();
      return 1;
    });
  });

  while (!started)
    std::this_thread::sleep_for(1ms);

  CHECK(pool.in_flight() == 1);
  CHECK_THROWS_AS(pool.run([]() { return 2; }), pwd::dispatch_error);

  release.set_value();
  CHECK(first.get() == 1);
  CHECK(pool.run([]() { return 3; }) == 3);
}

TEST_CASE("slow jobs time out but keep their slot", "[pool]") {
  hash_worker_pool pool(1, 1, 20ms);

  std::promise<void> release;
  auto released = release.get_future().share();

  CHECK_THROWS_AS(pool.run([released]() {
    released.wait();
    return 1;
  }), pwd::dispatch_error);

  // still running, so there's no room for another job
  CHECK(pool.in_flight() == 1);
  CHECK_THROWS_AS(pool.run([]() { return 2; }), pwd::dispatch_error);

  release.set_value();
  while (pool.in_flight() != 0)
    std::this_thread::sleep_for(1ms);

  CHECK(pool.run([]() { return 3; }) == 3);
}

TEST_CASE("concurrent callers", "[pool]") {
  hash_worker_pool pool(4, 64, 5000ms);

  std::vector<std::future<int>> results;
  for (int i = 0; i < 32; ++i) {
    results.push_back(std::async(std::launch::async, [&pool, i]() {
      return pool.run([i]() { return i * i; });
    }));
  }

  for (int i = 0; i < 32; ++i)
    CHECK(results[i].get() == i * i);
}

TEST_CASE("a shut down pool refuses work", "[pool]") {
  hash_worker_pool pool(1, 1, 5000ms);
  pool.shutdown();
  CHECK_THROWS_AS(pool.run([]() { return 1; }), pwd::dispatch_error);
}
