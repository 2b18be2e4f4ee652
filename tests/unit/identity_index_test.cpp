#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <atomic>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>

#include "tests/support/face_fixtures.hpp"
#include "visage/core/thread_pool.hpp"
#include "visage/index/identity_index.hpp"

using namespace visage;
using namespace visage::index;
using Catch::Matchers::WithinAbs;
using face_fixtures::unit_vector;
using face_fixtures::with_similarity;

namespace {

constexpr std::size_t kDim = 64;

store::DescriptorEntry entry(FaceId face, PersonId person, std::vector<float> d) {
  return store::DescriptorEntry{face, person, std::move(d)};
}

} // anonymous namespace

TEST_CASE("flat snapshot matches the best verified face", "[index]") {
  const auto alice = unit_vector(kDim, 1);
  const auto bob = unit_vector(kDim, 2);
  std::vector<store::DescriptorEntry> entries{
      entry(10, 1, alice),
      entry(11, 1, with_similarity(alice, 0.8f, 3)),
      entry(20, 2, bob),
  };
  auto snap = IdentitySnapshot::build(entries, {.dimension = kDim});
  REQUIRE(snap.has_value());
  REQUIRE((*snap)->size() == 3);
  REQUIRE((*snap)->person_count() == 2);
  REQUIRE((*snap)->mode() == IndexMode::flat);

  SECTION("exact descriptor returns its own face") {
    auto m = (*snap)->query(alice, 0.6f);
    REQUIRE(m.has_value());
    REQUIRE(m->has_value());
    CHECK((*m)->person_id == 1);
    CHECK((*m)->face_id == 10);
    CHECK_THAT((*m)->score, WithinAbs(1.0f, 1e-5f));
  }

  SECTION("threshold is inclusive and filters weak matches") {
    const auto probe = with_similarity(bob, 0.5f, 9);
    auto weak = (*snap)->query(probe, 0.6f);
    REQUIRE(weak.has_value());
    CHECK_FALSE(weak->has_value());

    auto strong = (*snap)->query(bob, 1.0f - 1e-5f);
    REQUIRE(strong.has_value());
    REQUIRE(strong->has_value());
    CHECK((*strong)->person_id == 2);
  }

  SECTION("query is scale invariant") {
    std::vector<float> scaled = bob;
    for (auto& x : scaled) x *= 7.5f;
    auto m = (*snap)->query(scaled, 0.9f);
    REQUIRE(m.has_value());
    REQUIRE(m->has_value());
    CHECK((*m)->face_id == 20);
  }

  SECTION("bad queries are rejected") {
    auto short_q = (*snap)->query(unit_vector(kDim - 1, 4), 0.5f);
    REQUIRE_FALSE(short_q.has_value());
    CHECK(short_q.error().code == core::error_code::validation_failed);

    std::vector<float> zero(kDim, 0.0f);
    CHECK((*snap)->query(zero, 0.5f).error().code == core::error_code::validation_failed);

    auto nan_q = alice;
    nan_q[3] = std::numeric_limits<float>::quiet_NaN();
    CHECK((*snap)->query(nan_q, 0.5f).error().code == core::error_code::validation_failed);
  }

  SECTION("search ranks persons by best face") {
    auto probe = with_similarity(alice, 0.95f, 5);
    auto top = (*snap)->search(probe, 5);
    REQUIRE(top.has_value());
    REQUIRE(top->size() == 2);
    CHECK((*top)[0].person_id == 1);
    CHECK((*top)[0].score >= (*top)[1].score);

    auto one = (*snap)->search(probe, 1);
    REQUIRE(one.has_value());
    CHECK(one->size() == 1);
  }
}

TEST_CASE("equal scores resolve to the smallest person id", "[index]") {
  const auto d = unit_vector(kDim, 42);
  std::vector<store::DescriptorEntry> entries{entry(7, 9, d), entry(5, 4, d), entry(6, 4, d)};
  auto snap = IdentitySnapshot::build(entries, {.dimension = kDim});
  REQUIRE(snap.has_value());

  auto m = (*snap)->query(d, 0.5f);
  REQUIRE(m.has_value());
  REQUIRE(m->has_value());
  CHECK((*m)->person_id == 4);
  CHECK((*m)->face_id == 5);
}

TEST_CASE("empty snapshot never matches", "[index]") {
  auto snap = IdentitySnapshot::make_empty({.dimension = kDim});
  auto m = snap->query(unit_vector(kDim, 1), -1.0f);
  REQUIRE(m.has_value());
  CHECK_FALSE(m->has_value());
  CHECK(snap->search(unit_vector(kDim, 1), 3)->empty());
}

TEST_CASE("snapshot build rejects inconsistent entries", "[index]") {
  const IndexBuildParams params{.dimension = kDim};

  SECTION("verified face without person") {
    std::vector<store::DescriptorEntry> entries{{1, std::nullopt, unit_vector(kDim, 1)}};
    auto r = IdentitySnapshot::build(entries, params);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == core::error_code::data_integrity);
  }
  SECTION("duplicate face") {
    std::vector<store::DescriptorEntry> entries{entry(1, 1, unit_vector(kDim, 1)),
                                                entry(1, 2, unit_vector(kDim, 2))};
    auto r = IdentitySnapshot::build(entries, params);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == core::error_code::data_integrity);
    CHECK(r.error().ids == std::vector<std::uint64_t>{1});
  }
  SECTION("wrong dimension") {
    std::vector<store::DescriptorEntry> entries{entry(3, 1, unit_vector(kDim + 1, 1))};
    auto r = IdentitySnapshot::build(entries, params);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == core::error_code::validation_failed);
    CHECK(r.error().ids == std::vector<std::uint64_t>{3});
  }
  SECTION("zero descriptor") {
    std::vector<store::DescriptorEntry> entries{entry(4, 1, std::vector<float>(kDim, 0.0f))};
    CHECK(IdentitySnapshot::build(entries, params).error().code == core::error_code::validation_failed);
  }
}

TEST_CASE("IVF snapshot keeps recall above the threshold", "[index][ivf]") {
  constexpr std::size_t persons = 200;
  constexpr std::size_t faces_per_person = 5;
  std::vector<store::DescriptorEntry> entries;
  std::vector<std::vector<float>> anchors;
  for (std::size_t p = 0; p < persons; ++p) {
    anchors.push_back(unit_vector(kDim, static_cast<std::uint32_t>(1000 + p)));
    for (std::size_t f = 0; f < faces_per_person; ++f) {
      entries.push_back(entry(p * faces_per_person + f + 1, p + 1,
                              with_similarity(anchors.back(), 0.9f, static_cast<std::uint32_t>(p * 31 + f))));
    }
  }

  const IndexBuildParams ivf{.dimension = kDim, .mode = IndexMode::ivf, .nlist = 16, .nprobe = 1};
  const IndexBuildParams flat{.dimension = kDim};
  core::ThreadPool pool(2);
  auto approx = IdentitySnapshot::build(entries, ivf, &pool);
  auto exact = IdentitySnapshot::build(entries, flat);
  REQUIRE(approx.has_value());
  REQUIRE(exact.has_value());
  REQUIRE((*approx)->mode() == IndexMode::ivf);

  const float tau = 0.6f;
  for (std::size_t p = 0; p < persons; p += 7) {
    const auto probe = with_similarity(anchors[p], 0.8f, static_cast<std::uint32_t>(50000 + p));
    auto e = (*exact)->query(probe, tau);
    auto a = (*approx)->query(probe, tau);
    REQUIRE(e.has_value());
    REQUIRE(a.has_value());
    // A match above tau exists in the flat index iff the IVF index reports one.
    REQUIRE(e->has_value() == a->has_value());
    if (e->has_value()) CHECK((*a)->score >= tau);
  }
}

TEST_CASE("auto_select stays flat for small snapshots", "[index]") {
  std::vector<store::DescriptorEntry> entries{entry(1, 1, unit_vector(kDim, 1)),
                                              entry(2, 1, unit_vector(kDim, 2))};
  auto snap = IdentitySnapshot::build(
      entries, {.dimension = kDim, .mode = IndexMode::auto_select, .ivf_min_entries = 100});
  REQUIRE(snap.has_value());
  CHECK((*snap)->mode() == IndexMode::flat);
}

TEST_CASE("index mode names round-trip", "[index]") {
  for (auto m : {IndexMode::flat, IndexMode::ivf, IndexMode::auto_select}) {
    CHECK(parse_index_mode(to_string(m)) == m);
  }
  CHECK_FALSE(parse_index_mode("hnsw").has_value());
}

TEST_CASE("IdentityIndex publishes snapshots atomically", "[index]") {
  IdentityIndex index({.dimension = kDim});
  CHECK(index.generation() == 0);
  CHECK(index.snapshot()->empty());
  CHECK(index.status().has_value());

  std::vector<store::DescriptorEntry> entries{entry(1, 1, unit_vector(kDim, 1))};
  auto first = IdentitySnapshot::build(entries, index.params());
  REQUIRE(first.has_value());
  index.replace(*first);
  CHECK(index.generation() == 1);

  auto held = index.snapshot();
  index.mark_failed(core::error{core::error_code::store_failure, "disk gone", "test", {}});
  auto st = index.status();
  REQUIRE_FALSE(st.has_value());
  CHECK(st.error().code == core::error_code::index_unavailable);
  CHECK(index.snapshot() == held);

  entries.push_back(entry(2, 2, unit_vector(kDim, 2)));
  auto second = IdentitySnapshot::build(entries, index.params());
  REQUIRE(second.has_value());
  index.replace(*second);
  CHECK(index.generation() == 2);
  CHECK(index.status().has_value());
  CHECK(held->size() == 1);
  CHECK(index.snapshot()->size() == 2);
}

TEST_CASE("readers never observe a partial snapshot", "[index][concurrency]") {
  IdentityIndex index({.dimension = kDim});
  std::atomic<bool> done{false};
  std::atomic<int> bad{0};

  std::thread reader([&] {
    const auto q = unit_vector(kDim, 77);
    while (!done.load()) {
      auto snap = index.snapshot();
      if (snap->face_ids().size() != snap->person_ids().size()) ++bad;
      if (!snap->query(q, -1.0f).has_value()) ++bad;
    }
  });

  std::vector<store::DescriptorEntry> entries;
  for (FaceId f = 1; f <= 50; ++f) {
    entries.push_back(entry(f, f % 5 + 1, unit_vector(kDim, static_cast<std::uint32_t>(f))));
    auto snap = IdentitySnapshot::build(entries, index.params());
    REQUIRE(snap.has_value());
    index.replace(*snap);
  }
  done.store(true);
  reader.join();
  CHECK(bad.load() == 0);
  CHECK(index.generation() == 50);
}
