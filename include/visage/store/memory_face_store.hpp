#pragma once

/** \file memory_face_store.hpp
 *  \brief In-process FaceRecordStore with Roaring-bitmap id sets.
 *
 * Example usage:
 * ```cpp
 * MemoryFaceStore store({.dimension = 512});
 * store.add_photo({.id = 1, .gallery_id = 7});
 * store.add_face(face);
 * auto alice = store.create_person({.display_name = "Alice"});
 * ```
 *
 * Thread-safety: all calls are thread-safe. Readers share a lock; each
 * mutating call holds the exclusive lock for its whole duration, which is
 * what makes it a transaction.
 *
 * Face and person ids must fit in 32 bits (Roaring bitmaps).
 */

#include <memory>
#include <string>

#include "visage/store/face_record_store.hpp"

namespace visage::store {

/** \brief MemoryFaceStore configuration. */
struct MemoryStoreConfig {
    std::size_t dimension{0};          /**< required descriptor dimension (0 = set by first face) */
    std::size_t scan_batch_size{256};  /**< entries copied per lock acquisition by cursors */
};

class MemoryFaceStore final : public FaceRecordStore {
public:
    MemoryFaceStore();
    explicit MemoryFaceStore(MemoryStoreConfig config);
    ~MemoryFaceStore() override;

    MemoryFaceStore(MemoryFaceStore&&) noexcept;
    MemoryFaceStore& operator=(MemoryFaceStore&&) noexcept;
    MemoryFaceStore(const MemoryFaceStore&) = delete;
    MemoryFaceStore& operator=(const MemoryFaceStore&) = delete;

    auto add_photo(const Photo& photo) -> std::expected<void, core::error> override;
    auto add_face(const FaceRecord& face) -> std::expected<void, core::error> override;
    auto remove_photo(PhotoId photo) -> std::expected<std::vector<FaceRecord>, core::error> override;

    auto create_person(const PersonDraft& draft) -> std::expected<Person, core::error> override;
    auto get_person(PersonId id) const -> std::expected<Person, core::error> override;
    auto list_people() const -> std::expected<std::vector<PersonSummary>, core::error> override;
    auto update_person(PersonId id, const PersonUpdate& update)
        -> std::expected<Person, core::error> override;
    auto delete_person(PersonId id, DeleteCascade policy)
        -> std::expected<DeletionSummary, core::error> override;
    auto create_person_with_faces(const PersonDraft& draft, std::span<const FaceId> faces)
        -> std::expected<Person, core::error> override;

    auto get_face(FaceId id) const -> std::expected<FaceRecord, core::error> override;
    auto faces_for_person(PersonId id) const -> std::expected<std::vector<FaceRecord>, core::error> override;
    auto faces_on_photo(PhotoId id) const -> std::expected<std::vector<FaceRecord>, core::error> override;

    auto set_assignment(FaceId face, PersonId person, bool verified,
                        std::optional<float> confidence)
        -> std::expected<FaceRecord, core::error> override;
    auto clear_assignment(FaceId face) -> std::expected<FaceRecord, core::error> override;
    auto batch_set_verified(std::span<const FaceId> faces, PersonId person)
        -> std::expected<std::size_t, core::error> override;
    auto unlink_faces(PersonId person, std::span<const FaceId> faces)
        -> std::expected<std::vector<FaceRecord>, core::error> override;

    auto verified_descriptors() const
        -> std::expected<std::unique_ptr<DescriptorCursor>, core::error> override;
    auto unassigned_descriptors(const ClusterScope& scope) const
        -> std::expected<std::vector<DescriptorEntry>, core::error> override;

    /** \brief Store statistics. */
    struct Stats {
        std::size_t people{0};
        std::size_t photos{0};
        std::size_t faces{0};
        std::size_t verified{0};
        std::size_t unassigned{0};
        std::size_t memory_usage_bytes{0};  /**< bitmap bytes only */
    };

    auto get_stats() const -> Stats;

    /** \brief Save all records to a binary file. */
    auto save(const std::string& path) const -> std::expected<void, core::error>;

    /** \brief Replace contents with a file written by save(). */
    auto load(const std::string& path) -> std::expected<void, core::error>;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;   // shared with live cursors
};

} // namespace visage::store
