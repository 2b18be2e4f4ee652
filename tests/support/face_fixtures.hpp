#pragma once

// Synthetic descriptors and store seeding for unit tests.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "visage/kernels/distance.hpp"
#include "visage/store/face_record_store.hpp"

namespace face_fixtures {

/** Random unit vector. */
inline std::vector<float> unit_vector(std::size_t dim, std::uint32_t seed) {
  std::mt19937 gen(seed);
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<float> v(dim);
  for (auto& x : v) x = dist(gen);
  visage::kernels::normalize(v);
  return v;
}

/** Unit vector whose cosine similarity to unit vector base is exactly sim (up to rounding). */
inline std::vector<float> with_similarity(std::span<const float> base, float sim, std::uint32_t seed) {
  auto r = unit_vector(base.size(), seed);
  const float proj = visage::kernels::inner_product(r, base);
  for (std::size_t i = 0; i < r.size(); ++i) r[i] -= proj * base[i];
  visage::kernels::normalize(r);
  const float ortho = std::sqrt(std::max(0.0f, 1.0f - sim * sim));
  std::vector<float> v(base.size());
  for (std::size_t i = 0; i < v.size(); ++i) v[i] = sim * base[i] + ortho * r[i];
  visage::kernels::normalize(v);
  return v;
}

inline visage::store::FaceRecord make_face(visage::FaceId id, visage::PhotoId photo,
                                           std::vector<float> descriptor) {
  visage::store::FaceRecord f;
  f.id = id;
  f.photo_id = photo;
  f.descriptor = std::move(descriptor);
  f.bounding_box = {10.0f, 20.0f, 64.0f, 64.0f};
  f.detection_confidence = 0.98f;
  return f;
}

/** Register photo (gallery 1 unless given) and insert a face on it; throws on failure. */
inline void add_face(visage::store::FaceRecordStore& store, visage::FaceId id, visage::PhotoId photo,
                     std::vector<float> descriptor, visage::GalleryId gallery = 1) {
  if (!store.add_photo({photo, gallery})) throw std::runtime_error("add_photo failed");
  if (!store.add_face(make_face(id, photo, std::move(descriptor)))) throw std::runtime_error("add_face failed");
}

inline visage::PersonId add_person(visage::store::FaceRecordStore& store, std::string name) {
  auto p = store.create_person({std::move(name), std::nullopt});
  if (!p) throw std::runtime_error("create_person failed");
  return p->id;
}

/** Face ids of every verified face, sorted. */
inline std::vector<visage::FaceId> verified_face_ids(const visage::store::FaceRecordStore& store) {
  std::vector<visage::FaceId> out;
  auto cursor = store.verified_descriptors();
  if (!cursor) throw std::runtime_error("cursor failed");
  while (true) {
    auto e = (*cursor)->next();
    if (!e) throw std::runtime_error("cursor next failed");
    if (!*e) break;
    out.push_back((*e)->face_id);
  }
  return out;
}

} // namespace face_fixtures
