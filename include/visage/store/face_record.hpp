#pragma once

/** \file face_record.hpp
 *  \brief Typed records for people, photos and detected faces.
 *
 * Records are fixed structs with explicit optional fields. A FaceRecord's
 * descriptor never changes after ingest; only person_id, verified and
 * recognition_confidence are mutated, and only through FaceRecordStore.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace visage {

using PersonId = std::uint64_t;
using FaceId = std::uint64_t;
using PhotoId = std::uint64_t;
using GalleryId = std::uint64_t;

/** \brief Seconds since the Unix epoch. */
using Timestamp = std::int64_t;

} // namespace visage

namespace visage::store {

/** \brief A recognised identity. Display fields are opaque to the engine. */
struct Person {
    PersonId id{};
    std::string display_name;
    std::optional<std::string> avatar_url;
    Timestamp created_at{};
};

/** \brief Input for creating a person; the store assigns id and created_at. */
struct PersonDraft {
    std::string display_name;
    std::optional<std::string> avatar_url;
};

/** \brief Partial update; disengaged fields are left unchanged. */
struct PersonUpdate {
    std::optional<std::string> display_name;
    std::optional<std::string> avatar_url;
};

/** \brief Person with face statistics, for listings. */
struct PersonSummary {
    Person person;
    std::size_t face_count{0};       /**< faces linked (verified or not) */
    std::size_t verified_count{0};   /**< faces linked and verified */
};

/** \brief Minimal photo record: enough to scope faces by gallery. */
struct Photo {
    PhotoId id{};
    GalleryId gallery_id{};
};

/** \brief Face bounding box in source-image pixels. */
struct BoundingBox {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};
};

/** \brief Assignment state of a face, derived from its fields. */
enum class AssignmentState {
    Unassigned,          /**< person_id empty */
    AssignedUnverified,  /**< person_id set, verified == false */
    Verified             /**< person_id set, verified == true, confidence == 1 */
};

/** \brief One detected face. */
struct FaceRecord {
    FaceId id{};
    PhotoId photo_id{};
    std::vector<float> descriptor;                  /**< unit-norm, fixed dimension */
    BoundingBox bounding_box;
    float detection_confidence{0.0f};
    std::optional<PersonId> person_id;
    bool verified{false};
    std::optional<float> recognition_confidence;

    [[nodiscard]] auto state() const noexcept -> AssignmentState {
        if (!person_id) return AssignmentState::Unassigned;
        return verified ? AssignmentState::Verified : AssignmentState::AssignedUnverified;
    }
};

/** \brief (face, person?, descriptor) triple produced by store scans. */
struct DescriptorEntry {
    FaceId face_id{};
    std::optional<PersonId> person_id;
    std::vector<float> descriptor;
};

/** \brief Which unassigned faces a clustering run considers. */
struct ClusterScope {
    /** Restrict to one gallery. */
    std::optional<GalleryId> gallery_id;
    /** Restrict to these photos (ignored when empty). Combined with gallery_id by AND. */
    std::vector<PhotoId> photo_ids;

    static auto corpus() -> ClusterScope { return {}; }
    static auto gallery(GalleryId g) -> ClusterScope { return ClusterScope{g, {}}; }
};

/** \brief What happens to a deleted person's faces. */
enum class DeleteCascade {
    detach,        /**< clear to Unassigned; descriptors stay available for clustering */
    remove_faces   /**< delete the FaceRecords themselves */
};

/** \brief Outcome of delete_person. */
struct DeletionSummary {
    std::size_t detached{0};
    std::size_t removed{0};
    bool removed_verified{false};   /**< any removed/detached face was verified */
};

} // namespace visage::store
