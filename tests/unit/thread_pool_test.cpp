#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stdexcept>
#include <vector>

#include "visage/core/thread_pool.hpp"

using visage::core::ThreadPool;

TEST_CASE("submit returns task results", "[thread_pool]") {
  ThreadPool pool(2);
  auto f = pool.submit([](int a, int b) { return a + b; }, 2, 3);
  REQUIRE(f.get() == 5);
}

TEST_CASE("parallel_for visits every index once", "[thread_pool]") {
  ThreadPool pool(4);
  std::vector<std::atomic<int>> hits(1000);
  pool.parallel_for(0, hits.size(), [&](std::size_t i) { hits[i].fetch_add(1); });
  for (const auto& h : hits) REQUIRE(h.load() == 1);
}

TEST_CASE("parallel_for rethrows after all chunks finish", "[thread_pool]") {
  ThreadPool pool(2);
  std::atomic<int> done{0};
  REQUIRE_THROWS_AS(pool.parallel_for(0, 64, [&](std::size_t i) {
    done.fetch_add(1);
    if (i == 10) throw std::runtime_error("boom");
  }, 8), std::runtime_error);
  // parallel_for only returns once every chunk has run; the throwing chunk
  // stops after index 10, the other seven run to completion.
  REQUIRE(done.load() >= 57);
}

TEST_CASE("destruction drains queued tasks", "[thread_pool]") {
  std::atomic<int> n{0};
  {
    ThreadPool pool(3);
    REQUIRE(pool.num_threads() == 3);
    for (int i = 0; i < 200; ++i) (void)pool.submit([&n] { n.fetch_add(1); });
  }
  REQUIRE(n.load() == 200);
}
