#pragma once

/** \file face_record_store.hpp
 *  \brief Abstract typed store over person/photo/face relational state.
 *
 * Contract
 * - Every mutating call is one transaction: it either applies completely or
 *   returns an error with nothing applied.
 * - Calls are thread-safe. Distinct calls are not serialized against each other
 *   beyond the transaction guarantee.
 * - Errors: not_found for absent ids, validation_failed for rejected input
 *   (ids listed in error::ids), store_failure when the backend is unreachable.
 *
 * The store is injected into the engine and must outlive it.
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "visage/error.hpp"
#include "visage/store/face_record.hpp"

namespace visage::store {

/** \brief Lazy, finite cursor over (person, descriptor) pairs.
 *
 * A cursor walks the state as it exists while it advances; it is not a
 * point-in-time snapshot. Restart by asking the store for a new cursor.
 */
class DescriptorCursor {
public:
    virtual ~DescriptorCursor() = default;

    /** \brief Next entry, nullopt at end, or an error (the cursor is then spent). */
    virtual auto next() -> std::expected<std::optional<DescriptorEntry>, core::error> = 0;
};

class FaceRecordStore {
public:
    virtual ~FaceRecordStore() = default;

    // ---- ingest (upstream detector side) ----

    /** \brief Register a photo; idempotent for an identical record. */
    virtual auto add_photo(const Photo& photo) -> std::expected<void, core::error> = 0;

    /** \brief Insert a detected face. The photo must exist; the id must be new.
     *
     * Preconditions: descriptor non-empty and finite. The face is stored
     * Unassigned regardless of the assignment fields passed in.
     */
    virtual auto add_face(const FaceRecord& face) -> std::expected<void, core::error> = 0;

    /** \brief Remove a photo and every face on it. Returns the removed faces. */
    virtual auto remove_photo(PhotoId photo) -> std::expected<std::vector<FaceRecord>, core::error> = 0;

    // ---- people ----

    virtual auto create_person(const PersonDraft& draft) -> std::expected<Person, core::error> = 0;
    virtual auto get_person(PersonId id) const -> std::expected<Person, core::error> = 0;
    virtual auto list_people() const -> std::expected<std::vector<PersonSummary>, core::error> = 0;
    virtual auto update_person(PersonId id, const PersonUpdate& update)
        -> std::expected<Person, core::error> = 0;

    /** \brief Delete a person and cascade to its faces per policy. */
    virtual auto delete_person(PersonId id, DeleteCascade policy)
        -> std::expected<DeletionSummary, core::error> = 0;

    /** \brief Create a person and verify all given faces to it in one transaction.
     *
     * Every id must name an existing face that is Unassigned at commit time;
     * otherwise validation_failed lists the offending ids and nothing is created.
     */
    virtual auto create_person_with_faces(const PersonDraft& draft, std::span<const FaceId> faces)
        -> std::expected<Person, core::error> = 0;

    // ---- faces ----

    virtual auto get_face(FaceId id) const -> std::expected<FaceRecord, core::error> = 0;
    virtual auto faces_for_person(PersonId id) const -> std::expected<std::vector<FaceRecord>, core::error> = 0;
    virtual auto faces_on_photo(PhotoId id) const -> std::expected<std::vector<FaceRecord>, core::error> = 0;

    /** \brief Link a face to a person. Returns the record as it was before.
     *
     * verified == true forces confidence to 1.0. Idempotent.
     * Errors: not_found if the face or the person is unknown.
     */
    virtual auto set_assignment(FaceId face, PersonId person, bool verified,
                                std::optional<float> confidence)
        -> std::expected<FaceRecord, core::error> = 0;

    /** \brief Reset a face to Unassigned. Returns the record as it was before.
     *  Already-unassigned faces succeed without change. */
    virtual auto clear_assignment(FaceId face) -> std::expected<FaceRecord, core::error> = 0;

    /** \brief Verify the subset of faces currently linked to person.
     *
     * Faces not linked to person are skipped. Returns how many faces linked to
     * person are verified by this call (already-verified faces count).
     */
    virtual auto batch_set_verified(std::span<const FaceId> faces, PersonId person)
        -> std::expected<std::size_t, core::error> = 0;

    /** \brief Unassign the subset of faces currently linked to person.
     *  Returns the faces that were unlinked. */
    virtual auto unlink_faces(PersonId person, std::span<const FaceId> faces)
        -> std::expected<std::vector<FaceRecord>, core::error> = 0;

    // ---- scans ----

    /** \brief Cursor over every verified face. Each call re-scans current state. */
    virtual auto verified_descriptors() const
        -> std::expected<std::unique_ptr<DescriptorCursor>, core::error> = 0;

    /** \brief Snapshot of unassigned faces within scope, ordered by face id. */
    virtual auto unassigned_descriptors(const ClusterScope& scope) const
        -> std::expected<std::vector<DescriptorEntry>, core::error> = 0;
};

} // namespace visage::store
