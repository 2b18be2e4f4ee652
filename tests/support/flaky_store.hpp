#pragma once

// Forwarding FaceRecordStore that can fail or stall verified scans on demand.

#include <atomic>
#include <condition_variable>
#include <mutex>

#include "visage/store/face_record_store.hpp"

namespace face_fixtures {

class FlakyStore final : public visage::store::FaceRecordStore {
public:
  explicit FlakyStore(visage::store::FaceRecordStore& inner) : inner_(inner) {}

  /** Make every verified scan fail with store_failure until cleared. */
  void fail_scans(bool on) { fail_.store(on); }

  /** Block verified scans until open_gate(). */
  void close_gate() {
    std::lock_guard lock(mutex_);
    gate_closed_ = true;
  }
  void open_gate() {
    {
      std::lock_guard lock(mutex_);
      gate_closed_ = false;
    }
    cv_.notify_all();
  }
  /** Wait until a scan is parked at the closed gate. */
  void wait_for_parked_scan() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return parked_ > 0; });
  }

  int scans() const { return scans_.load(); }

  auto add_photo(const visage::store::Photo& photo) -> std::expected<void, visage::core::error> override {
    return inner_.add_photo(photo);
  }
  auto add_face(const visage::store::FaceRecord& face) -> std::expected<void, visage::core::error> override {
    return inner_.add_face(face);
  }
  auto remove_photo(visage::PhotoId photo)
      -> std::expected<std::vector<visage::store::FaceRecord>, visage::core::error> override {
    return inner_.remove_photo(photo);
  }
  auto create_person(const visage::store::PersonDraft& draft)
      -> std::expected<visage::store::Person, visage::core::error> override {
    return inner_.create_person(draft);
  }
  auto get_person(visage::PersonId id) const
      -> std::expected<visage::store::Person, visage::core::error> override {
    return inner_.get_person(id);
  }
  auto list_people() const
      -> std::expected<std::vector<visage::store::PersonSummary>, visage::core::error> override {
    return inner_.list_people();
  }
  auto update_person(visage::PersonId id, const visage::store::PersonUpdate& update)
      -> std::expected<visage::store::Person, visage::core::error> override {
    return inner_.update_person(id, update);
  }
  auto delete_person(visage::PersonId id, visage::store::DeleteCascade policy)
      -> std::expected<visage::store::DeletionSummary, visage::core::error> override {
    return inner_.delete_person(id, policy);
  }
  auto create_person_with_faces(const visage::store::PersonDraft& draft, std::span<const visage::FaceId> faces)
      -> std::expected<visage::store::Person, visage::core::error> override {
    return inner_.create_person_with_faces(draft, faces);
  }
  auto get_face(visage::FaceId id) const
      -> std::expected<visage::store::FaceRecord, visage::core::error> override {
    return inner_.get_face(id);
  }
  auto faces_for_person(visage::PersonId id) const
      -> std::expected<std::vector<visage::store::FaceRecord>, visage::core::error> override {
    return inner_.faces_for_person(id);
  }
  auto faces_on_photo(visage::PhotoId id) const
      -> std::expected<std::vector<visage::store::FaceRecord>, visage::core::error> override {
    return inner_.faces_on_photo(id);
  }
  auto set_assignment(visage::FaceId face, visage::PersonId person, bool verified, std::optional<float> confidence)
      -> std::expected<visage::store::FaceRecord, visage::core::error> override {
    return inner_.set_assignment(face, person, verified, confidence);
  }
  auto clear_assignment(visage::FaceId face)
      -> std::expected<visage::store::FaceRecord, visage::core::error> override {
    return inner_.clear_assignment(face);
  }
  auto batch_set_verified(std::span<const visage::FaceId> faces, visage::PersonId person)
      -> std::expected<std::size_t, visage::core::error> override {
    return inner_.batch_set_verified(faces, person);
  }
  auto unlink_faces(visage::PersonId person, std::span<const visage::FaceId> faces)
      -> std::expected<std::vector<visage::store::FaceRecord>, visage::core::error> override {
    return inner_.unlink_faces(person, faces);
  }
  auto unassigned_descriptors(const visage::store::ClusterScope& scope) const
      -> std::expected<std::vector<visage::store::DescriptorEntry>, visage::core::error> override {
    return inner_.unassigned_descriptors(scope);
  }

  auto verified_descriptors() const
      -> std::expected<std::unique_ptr<visage::store::DescriptorCursor>, visage::core::error> override {
    ++scans_;
    {
      std::unique_lock lock(mutex_);
      if (gate_closed_) {
        ++parked_;
        cv_.notify_all();
        cv_.wait(lock, [this] { return !gate_closed_; });
        --parked_;
      }
    }
    if (fail_.load()) {
      return visage::core::make_error(visage::core::error_code::store_failure, "Injected scan failure",
                                      "test.flaky_store");
    }
    return inner_.verified_descriptors();
  }

private:
  visage::store::FaceRecordStore& inner_;
  std::atomic<bool> fail_{false};
  mutable std::atomic<int> scans_{0};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool gate_closed_{false};
  mutable int parked_{0};
};

} // namespace face_fixtures
