#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "tests/support/face_fixtures.hpp"
#include "tests/support/flaky_store.hpp"
#include "visage/index/rebuild_coordinator.hpp"
#include "visage/store/memory_face_store.hpp"

using namespace std::chrono_literals;
using namespace visage;
using namespace visage::index;
using face_fixtures::add_face;
using face_fixtures::add_person;
using face_fixtures::FlakyStore;
using face_fixtures::unit_vector;

namespace {

constexpr std::size_t kDim = 16;

class RecordingListener final : public RebuildListener {
public:
  void on_rebuild_succeeded(std::uint64_t generation, std::size_t entries) override {
    std::lock_guard lock(mutex_);
    successes.emplace_back(generation, entries);
  }
  void on_rebuild_failed(const core::error& err, std::uint32_t consecutive) override {
    std::lock_guard lock(mutex_);
    failures.emplace_back(err.code, consecutive);
  }

  std::mutex mutex_;
  std::vector<std::pair<std::uint64_t, std::size_t>> successes;
  std::vector<std::pair<core::error_code, std::uint32_t>> failures;
};

struct Fixture {
  store::MemoryFaceStore memory{{.dimension = kDim}};
  FlakyStore store{memory};
  IdentityIndex index{{.dimension = kDim}};
  PersonId alice{};

  Fixture() {
    for (FaceId f = 1; f <= 6; ++f) add_face(memory, f, f, unit_vector(kDim, static_cast<std::uint32_t>(f)));
    alice = add_person(memory, "Alice");
    for (FaceId f = 1; f <= 3; ++f) (void)memory.set_assignment(f, alice, true, std::nullopt);
  }
};

} // anonymous namespace

TEST_CASE("rebuild publishes the verified set", "[rebuild]") {
  Fixture fx;
  RebuildCoordinator coordinator(fx.store, fx.index);

  const auto ticket = coordinator.request_rebuild();
  REQUIRE(coordinator.wait(ticket).has_value());
  CHECK(fx.index.generation() == 1);
  CHECK(fx.index.snapshot()->size() == 3);
  CHECK(fx.index.status().has_value());

  auto s = coordinator.stats();
  CHECK(s.requests == 1);
  CHECK(s.succeeded == 1);
  CHECK_FALSE(s.running);
  CHECK_FALSE(s.retry_pending);
}

TEST_CASE("requests during a rebuild coalesce into one follow-up", "[rebuild]") {
  Fixture fx;
  RebuildCoordinator coordinator(fx.store, fx.index);

  fx.store.close_gate();
  (void)coordinator.request_rebuild();
  fx.store.wait_for_parked_scan();

  RebuildCoordinator::Ticket last = 0;
  for (FaceId f = 4; f <= 6; ++f) {
    REQUIRE(fx.memory.set_assignment(f, fx.alice, true, std::nullopt).has_value());
    for (int i = 0; i < 10; ++i) last = coordinator.request_rebuild();
  }
  CHECK(coordinator.stats().dirty);
  fx.store.open_gate();

  REQUIRE(coordinator.wait(last, 5s).has_value());
  auto s = coordinator.stats();
  CHECK(s.requests == 31);
  CHECK(s.coalesced == 29);
  CHECK(s.started == 2);
  CHECK(s.succeeded == 2);
  CHECK(fx.store.scans() == 2);
  CHECK(fx.index.snapshot()->size() == 6);
}

TEST_CASE("failed rebuild keeps the previous snapshot serving", "[rebuild]") {
  Fixture fx;
  RebuildCoordinator coordinator(fx.store, fx.index, {.escalate_after = 2});
  auto listener = std::make_shared<RecordingListener>();
  coordinator.set_listener(listener);

  REQUIRE(coordinator.wait(coordinator.request_rebuild()).has_value());
  const auto served = fx.index.snapshot();
  REQUIRE(served->size() == 3);

  fx.store.fail_scans(true);
  REQUIRE(fx.memory.set_assignment(4, fx.alice, true, std::nullopt).has_value());
  auto failed = coordinator.wait(coordinator.request_rebuild());
  REQUIRE_FALSE(failed.has_value());
  CHECK(failed.error().code == core::error_code::store_failure);

  CHECK(fx.index.snapshot() == served);
  auto st = fx.index.status();
  REQUIRE_FALSE(st.has_value());
  CHECK(st.error().code == core::error_code::index_unavailable);
  CHECK(coordinator.stats().retry_pending);

  // A second failure escalates; both are reported with their streak.
  CHECK_FALSE(coordinator.wait(coordinator.request_rebuild()).has_value());
  CHECK(coordinator.stats().consecutive_failures == 2);

  fx.store.fail_scans(false);
  REQUIRE(coordinator.wait(coordinator.request_rebuild()).has_value());
  CHECK(fx.index.status().has_value());
  CHECK(fx.index.snapshot()->size() == 4);
  auto s = coordinator.stats();
  CHECK(s.failed == 2);
  CHECK(s.consecutive_failures == 0);
  CHECK_FALSE(s.retry_pending);

  coordinator.stop();
  std::lock_guard lock(listener->mutex_);
  REQUIRE(listener->failures.size() == 2);
  CHECK(listener->failures[0] == std::make_pair(core::error_code::store_failure, std::uint32_t{1}));
  CHECK(listener->failures[1].second == 2);
  REQUIRE(listener->successes.size() == 2);
  CHECK(listener->successes.back().second == 4);
}

TEST_CASE("wait reports the attempt that covered the ticket", "[rebuild]") {
  Fixture fx;
  RebuildCoordinator coordinator(fx.store, fx.index);

  fx.store.fail_scans(true);
  const auto failed_ticket = coordinator.request_rebuild();
  auto first = coordinator.wait(failed_ticket, 5s);
  REQUIRE_FALSE(first.has_value());
  CHECK(first.error().code == core::error_code::store_failure);

  fx.store.fail_scans(false);
  const auto ok_ticket = coordinator.request_rebuild();
  REQUIRE(coordinator.wait(ok_ticket, 5s).has_value());

  // A late waiter on the earlier ticket still sees its own attempt's failure.
  auto late = coordinator.wait(failed_ticket, 5s);
  REQUIRE_FALSE(late.has_value());
  CHECK(late.error().code == core::error_code::store_failure);
  CHECK(coordinator.wait(ok_ticket, 5s).has_value());
}

TEST_CASE("backoff retries a failed rebuild without a new trigger", "[rebuild]") {
  Fixture fx;
  fx.store.fail_scans(true);
  RebuildCoordinator coordinator(fx.store, fx.index, {.retry_backoff = 20ms});

  CHECK_FALSE(coordinator.wait(coordinator.request_rebuild()).has_value());
  fx.store.fail_scans(false);

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (!fx.index.status().has_value() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  CHECK(fx.index.status().has_value());
  CHECK(fx.index.snapshot()->size() == 3);
  CHECK(coordinator.stats().started >= 2);
}

TEST_CASE("wait times out while a rebuild is stalled", "[rebuild]") {
  Fixture fx;
  RebuildCoordinator coordinator(fx.store, fx.index);

  fx.store.close_gate();
  const auto ticket = coordinator.request_rebuild();
  fx.store.wait_for_parked_scan();

  auto timed_out = coordinator.wait(ticket, 10ms);
  REQUIRE_FALSE(timed_out.has_value());
  CHECK(timed_out.error().code == core::error_code::cancelled);
  CHECK(coordinator.stats().running);

  fx.store.open_gate();
  CHECK(coordinator.wait(ticket).has_value());
}

TEST_CASE("stop interrupts a running rebuild and leaves work pending", "[rebuild]") {
  Fixture fx;
  RebuildCoordinator coordinator(fx.store, fx.index);

  fx.store.close_gate();
  const auto ticket = coordinator.request_rebuild();
  fx.store.wait_for_parked_scan();

  std::thread stopper([&] { coordinator.stop(); });
  std::this_thread::sleep_for(20ms);
  fx.store.open_gate();
  stopper.join();

  auto r = coordinator.wait(ticket);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == core::error_code::cancelled);

  auto s = coordinator.stats();
  CHECK(s.cancelled == 1);
  CHECK(s.succeeded == 0);
  CHECK(s.retry_pending);
  CHECK(fx.index.generation() == 0);
  CHECK(fx.index.status().has_value());

  // Requests after stop are recorded but never run.
  const auto late = coordinator.request_rebuild();
  CHECK(coordinator.wait(late, 50ms).error().code == core::error_code::cancelled);
  coordinator.stop();
}
