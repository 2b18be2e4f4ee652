#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <thread>
#include <vector>

#include "tests/support/face_fixtures.hpp"
#include "visage/store/sqlite_face_store.hpp"

using namespace visage;
using namespace visage::store;
using face_fixtures::add_face;
using face_fixtures::add_person;
using face_fixtures::unit_vector;
using face_fixtures::verified_face_ids;

namespace {

constexpr std::size_t kDim = 16;

auto open_memory_store(std::size_t batch = 256) -> std::unique_ptr<SqliteFaceStore> {
  auto pool = SqliteConnectionPool::open({.path = ":memory:"});
  REQUIRE(pool.has_value());
  auto store = SqliteFaceStore::open(*pool, {.dimension = kDim, .scan_batch_size = batch});
  REQUIRE(store.has_value());
  return std::move(*store);
}

} // anonymous namespace

TEST_CASE("sqlite store round-trips faces and people", "[store][sqlite]") {
  auto store = open_memory_store();
  add_face(*store, 1, 1, unit_vector(kDim, 1), 10);
  add_face(*store, 2, 1, unit_vector(kDim, 2), 10);
  const auto alice = add_person(*store, "Alice");

  auto face = store->get_face(1);
  REQUIRE(face.has_value());
  CHECK(face->photo_id == 1);
  CHECK(face->descriptor.size() == kDim);
  CHECK(face->state() == AssignmentState::Unassigned);
  CHECK(face->bounding_box.width == 64.0f);

  auto prev = store->set_assignment(1, alice, true, 0.2f);
  REQUIRE(prev.has_value());
  CHECK_FALSE(prev->person_id.has_value());
  auto now = store->get_face(1);
  REQUIRE(now.has_value());
  CHECK(now->verified);
  CHECK(now->recognition_confidence == 1.0f);

  auto people = store->list_people();
  REQUIRE(people.has_value());
  REQUIRE(people->size() == 1);
  CHECK(people->front().face_count == 1);
  CHECK(people->front().verified_count == 1);

  auto on_photo = store->faces_on_photo(1);
  REQUIRE(on_photo.has_value());
  CHECK(on_photo->size() == 2);
}

TEST_CASE("sqlite store rejects bad input without side effects", "[store][sqlite]") {
  auto store = open_memory_store();
  add_face(*store, 1, 1, unit_vector(kDim, 1));
  const auto alice = add_person(*store, "Alice");
  REQUIRE(store->set_assignment(1, alice, true, std::nullopt).has_value());

  CHECK(store->add_face(face_fixtures::make_face(2, 99, unit_vector(kDim, 2))).error().code ==
        core::error_code::not_found);
  CHECK(store->add_face(face_fixtures::make_face(2, 1, unit_vector(kDim - 1, 2))).error().code ==
        core::error_code::validation_failed);
  CHECK(store->set_assignment(5, alice, true, std::nullopt).error().code == core::error_code::not_found);
  CHECK(store->get_person(alice + 1).error().code == core::error_code::not_found);

  const std::vector<FaceId> ids{1};
  auto r = store->create_person_with_faces({"Bob", std::nullopt}, ids);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == core::error_code::validation_failed);
  CHECK(r.error().ids == std::vector<std::uint64_t>{1});
  CHECK(store->list_people()->size() == 1);
}

TEST_CASE("sqlite batch verify, unlink and delete", "[store][sqlite]") {
  auto store = open_memory_store(2);
  for (FaceId f = 1; f <= 5; ++f) add_face(*store, f, f, unit_vector(kDim, static_cast<std::uint32_t>(f)), 3);
  const auto alice = add_person(*store, "Alice");
  for (FaceId f = 1; f <= 4; ++f) REQUIRE(store->set_assignment(f, alice, false, 0.7f).has_value());

  const std::vector<FaceId> all{1, 2, 3, 4, 5};
  auto n = store->batch_set_verified(all, alice);
  REQUIRE(n.has_value());
  CHECK(*n == 4);
  CHECK(verified_face_ids(*store) == std::vector<FaceId>{1, 2, 3, 4});

  const std::vector<FaceId> drop{2, 5};
  auto unlinked = store->unlink_faces(alice, drop);
  REQUIRE(unlinked.has_value());
  REQUIRE(unlinked->size() == 1);
  CHECK(unlinked->front().id == 2);
  CHECK(unlinked->front().verified);

  auto pool = store->unassigned_descriptors(ClusterScope::gallery(3));
  REQUIRE(pool.has_value());
  REQUIRE(pool->size() == 2);
  CHECK((*pool)[0].face_id == 2);
  CHECK((*pool)[1].face_id == 5);

  auto s = store->delete_person(alice, DeleteCascade::detach);
  REQUIRE(s.has_value());
  CHECK(s->detached == 3);
  CHECK(s->removed_verified);
  CHECK(verified_face_ids(*store).empty());
  CHECK(store->unassigned_descriptors(ClusterScope::corpus())->size() == 5);
}

TEST_CASE("sqlite remove_faces cascade and remove_photo", "[store][sqlite]") {
  auto store = open_memory_store();
  add_face(*store, 1, 1, unit_vector(kDim, 1));
  add_face(*store, 2, 2, unit_vector(kDim, 2));
  const std::vector<FaceId> ids{1};
  auto bob = store->create_person_with_faces({"Bob", std::nullopt}, ids);
  REQUIRE(bob.has_value());

  auto s = store->delete_person(bob->id, DeleteCascade::remove_faces);
  REQUIRE(s.has_value());
  CHECK(s->removed == 1);
  CHECK(store->get_face(1).error().code == core::error_code::not_found);

  auto removed = store->remove_photo(2);
  REQUIRE(removed.has_value());
  CHECK(removed->size() == 1);
  CHECK(store->remove_photo(2).error().code == core::error_code::not_found);
}

TEST_CASE("sqlite file store shares state across pooled connections", "[store][sqlite]") {
  const auto path = std::filesystem::temp_directory_path() / "visage_sqlite_pool_test.db";
  std::filesystem::remove(path);
  {
    auto pool = SqliteConnectionPool::open({.path = path.string(), .max_connections = 3});
    REQUIRE(pool.has_value());
    auto opened = SqliteFaceStore::open(*pool, {.dimension = kDim});
    REQUIRE(opened.has_value());
    auto& store = **opened;
    REQUIRE(store.add_photo({1, 1}).has_value());

    std::vector<std::thread> writers;
    for (int t = 0; t < 3; ++t) {
      writers.emplace_back([&store, t] {
        for (int i = 0; i < 10; ++i) {
          const FaceId id = static_cast<FaceId>(t * 100 + i + 1);
          (void)store.add_face(face_fixtures::make_face(id, 1, unit_vector(kDim, static_cast<std::uint32_t>(id))));
        }
      });
    }
    for (auto& w : writers) w.join();

    auto faces = store.faces_on_photo(1);
    REQUIRE(faces.has_value());
    CHECK(faces->size() == 30);
    CHECK((*pool)->open_connections() <= 3);
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
}
