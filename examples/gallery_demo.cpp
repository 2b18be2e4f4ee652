/**
 * Gallery walkthrough using visage
 *
 * This example demonstrates:
 * - Ingesting detected faces into a store
 * - Clustering unassigned faces and promoting a cluster to a person
 * - Matching a new descriptor against the verified set
 * - Unlinking a face and deleting a person
 *
 * Usage: visage_gallery_demo [sqlite-path]
 * Without an argument the in-memory store is used.
 */

#include <visage/engine.hpp>
#include <visage/kernels/distance.hpp>
#include <visage/store/memory_face_store.hpp>
#include <visage/store/sqlite_face_store.hpp>

#include <iostream>
#include <memory>
#include <random>
#include <vector>

namespace {

constexpr std::size_t kDim = 128;

std::vector<float> noisy_copy(const std::vector<float>& anchor, float noise, std::mt19937& gen) {
    std::normal_distribution<float> nd(0.0f, noise);
    std::vector<float> v(anchor);
    for (auto& x : v) x += nd(gen);
    visage::kernels::normalize(v);
    return v;
}

std::vector<float> random_identity(std::mt19937& gen) {
    std::normal_distribution<float> nd(0.0f, 1.0f);
    std::vector<float> v(kDim);
    for (auto& x : v) x = nd(gen);
    visage::kernels::normalize(v);
    return v;
}

void print_error(const char* what, const visage::core::error& e) {
    std::cerr << what << " failed: " << visage::core::to_string(e.code) << ": " << e.message << "\n";
}

} // namespace

int main(int argc, char** argv) {
    using namespace visage;

    std::unique_ptr<store::FaceRecordStore> store;
    std::shared_ptr<store::SqliteConnectionPool> pool;
    if (argc > 1) {
        auto opened = store::SqliteConnectionPool::open({.path = argv[1]});
        if (!opened) {
            print_error("open database", opened.error());
            return 1;
        }
        pool = *opened;
        auto sqlite = store::SqliteFaceStore::open(pool, {.dimension = kDim});
        if (!sqlite) {
            print_error("open store", sqlite.error());
            return 1;
        }
        store = std::move(*sqlite);
    } else {
        store = std::make_unique<store::MemoryFaceStore>(store::MemoryStoreConfig{.dimension = kDim});
    }

    auto config = load_config_from_env();
    config.index.dimension = kDim;
    config.service.synchronous_rebuild = true;

    auto engine_result = Engine::open(config, *store);
    if (!engine_result) {
        print_error("open engine", engine_result.error());
        return 1;
    }
    auto& engine = **engine_result;
    auto& service = engine.service();

    // Two people, five photos each, plus a few strangers.
    std::mt19937 gen(2024);
    const auto ada = random_identity(gen);
    const auto grace = random_identity(gen);
    FaceId next_face = 1;
    for (PhotoId photo = 1; photo <= 13; ++photo) {
        if (auto r = store->add_photo({photo, 1}); !r) {
            print_error("add_photo", r.error());
            return 1;
        }
        store::FaceRecord face;
        face.id = next_face++;
        face.photo_id = photo;
        face.bounding_box = {32.0f, 48.0f, 96.0f, 96.0f};
        face.detection_confidence = 0.97f;
        face.descriptor = photo <= 5 ? noisy_copy(ada, 0.03f, gen)
                        : photo <= 10 ? noisy_copy(grace, 0.03f, gen)
                                      : random_identity(gen);
        if (auto r = store->add_face(face); !r) {
            print_error("add_face", r.error());
            return 1;
        }
    }

    auto clusters = service.cluster_unassigned(store::ClusterScope::gallery(1));
    if (!clusters) {
        print_error("cluster_unassigned", clusters.error());
        return 1;
    }
    std::cout << "Found " << clusters->size() << " clusters\n";
    for (const auto& c : *clusters) {
        std::cout << "  " << c.members.size() << " faces, first " << c.members.front() << "\n";
    }

    const char* names[] = {"Ada", "Grace"};
    std::vector<PersonId> people;
    for (std::size_t i = 0; i < 2 && i < clusters->size(); ++i) {
        auto person = service.create_person_from_cluster(names[i], (*clusters)[i].members);
        if (!person) {
            print_error("create_person_from_cluster", person.error());
            return 1;
        }
        people.push_back(person->id);
        std::cout << "Created " << person->display_name << " (id " << person->id << ")\n";
    }

    auto probe = noisy_copy(ada, 0.03f, gen);
    if (auto m = service.match_descriptor(probe); m && *m) {
        auto who = service.get_person((*m)->person_id);
        std::cout << "Probe matches " << (who ? who->display_name : "?")
                  << " via face " << (*m)->face_id << " (score " << (*m)->score << ")\n";
    } else if (!m) {
        print_error("match_descriptor", m.error());
    } else {
        std::cout << "Probe matches nobody\n";
    }

    if (!people.empty()) {
        auto faces = service.person_faces(people.front());
        if (faces && !faces->faces.empty()) {
            const FaceId first = faces->faces.front().id;
            if (auto r = service.unlink(people.front(), first); r) {
                std::cout << "Unlinked face " << first << "\n";
            }
        }
        if (auto r = service.delete_person(people.back()); r) {
            std::cout << "Deleted person " << people.back() << ", detached " << r->detached << " faces\n";
        }
    }

    if (auto listing = service.list_people(); listing) {
        for (const auto& p : *listing) {
            std::cout << p.person.display_name << ": " << p.verified_count << "/" << p.face_count
                      << " verified\n";
        }
    }

    engine.shutdown();
    return 0;
}
