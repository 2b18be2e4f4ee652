#pragma once

/** \file identity_service.hpp
 *  \brief Operator-facing identity operations: match, verify, unlink,
 *         delete, cluster and promote.
 *
 * Each mutating operation is one store transaction followed by at most one
 * rebuild request. A request is issued only when the set of verified faces
 * changed or may have changed; a rebuild failure is logged and retried, never
 * returned from the mutation.
 *
 * Per-face state machine:
 *   Unassigned -> AssignedUnverified   record_assignment(f, p, false)
 *   * -> Verified                       record_assignment(f, p, true), batch_verify,
 *                                       create_person_from_cluster
 *   * -> Unassigned                     clear_assignment, unlink, delete_person
 *
 * Thread-safety: all methods are thread-safe.
 */

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "visage/cluster/clustering.hpp"
#include "visage/error.hpp"
#include "visage/index/identity_index.hpp"
#include "visage/index/rebuild_coordinator.hpp"
#include "visage/store/face_record_store.hpp"

namespace visage::core { class ThreadPool; }

namespace visage::service {

/** \brief Service parameters. */
struct ServiceParams {
    float match_threshold{0.6f};                                  /**< tau_match */
    store::DeleteCascade delete_cascade{store::DeleteCascade::detach};
    bool synchronous_rebuild{false};                              /**< wait for the rebuild a mutation requested */
    std::chrono::milliseconds sync_timeout{30000};
    std::size_t cluster_threads{0};                               /**< 0 = cluster on the calling thread */
};

/** \brief A person with every linked face. */
struct PersonFaces {
    store::Person person;
    std::vector<store::FaceRecord> faces;
};

class IdentityService {
public:
    /** store, index and coordinator must outlive the service. */
    IdentityService(store::FaceRecordStore& store, index::IdentityIndex& index,
                    index::RebuildCoordinator& coordinator, ServiceParams params = {},
                    cluster::ClusterParams cluster_params = {});
    ~IdentityService();

    IdentityService(const IdentityService&) = delete;
    IdentityService& operator=(const IdentityService&) = delete;

    // ---- matching ----

    /** \brief Best verified person for a descriptor, or nullopt below threshold.
     *  Uses the configured tau_match unless threshold is given. */
    auto match_descriptor(std::span<const float> descriptor,
                          std::optional<float> threshold = std::nullopt) const
        -> std::expected<std::optional<index::Match>, core::error>;

    /** \brief Top-k candidate persons for a descriptor. */
    auto suggest(std::span<const float> descriptor, std::size_t k) const
        -> std::expected<std::vector<index::Match>, core::error>;

    /** \brief index_unavailable if the last rebuild failed. */
    auto index_status() const -> std::expected<void, core::error>;

    // ---- assignment ----

    auto record_assignment(FaceId face, PersonId person, bool verified,
                           std::optional<float> confidence = std::nullopt)
        -> std::expected<void, core::error>;
    auto clear_assignment(FaceId face) -> std::expected<void, core::error>;

    /** \brief Verify the given faces that are linked to person. Returns the count. */
    auto batch_verify(PersonId person, std::span<const FaceId> faces)
        -> std::expected<std::size_t, core::error>;

    /** \brief Unassign face from person. Returns 1 if it was linked, else 0. */
    auto unlink(PersonId person, FaceId face) -> std::expected<std::size_t, core::error>;

    auto delete_person(PersonId person) -> std::expected<store::DeletionSummary, core::error>;
    auto delete_person(PersonId person, store::DeleteCascade policy)
        -> std::expected<store::DeletionSummary, core::error>;

    // ---- clustering ----

    /** \brief Cluster unassigned faces in scope (read-only). */
    auto cluster_unassigned(const store::ClusterScope& scope,
                            std::optional<float> threshold = std::nullopt) const
        -> std::expected<std::vector<cluster::Cluster>, core::error>;

    /** \brief Create a person and verify every listed face to it, atomically. */
    auto create_person_from_cluster(const std::string& display_name, std::span<const FaceId> faces)
        -> std::expected<store::Person, core::error>;

    // ---- people ----

    auto create_person(const store::PersonDraft& draft) -> std::expected<store::Person, core::error>;
    auto get_person(PersonId person) const -> std::expected<store::Person, core::error>;
    auto list_people() const -> std::expected<std::vector<store::PersonSummary>, core::error>;
    auto update_person(PersonId person, const store::PersonUpdate& update)
        -> std::expected<store::Person, core::error>;
    auto update_avatar(PersonId person, std::string avatar_url)
        -> std::expected<store::Person, core::error>;
    auto person_faces(PersonId person) const -> std::expected<PersonFaces, core::error>;

    // ---- photo-scoped ----

    /** \brief Verify every face on photo linked to person. */
    auto verify_on_photo(PersonId person, PhotoId photo) -> std::expected<std::size_t, core::error>;

    /** \brief verify_on_photo over several photos, as one mutation. */
    auto batch_verify_on_photos(PersonId person, std::span<const PhotoId> photos)
        -> std::expected<std::size_t, core::error>;

    /** \brief Unassign every face on photo linked to person. */
    auto unlink_from_photo(PersonId person, PhotoId photo) -> std::expected<std::size_t, core::error>;

    [[nodiscard]] auto params() const noexcept -> const ServiceParams& { return params_; }

private:
    auto check_threshold(float t, const char* component) const -> std::expected<void, core::error>;
    auto faces_linked_on_photos(PersonId person, std::span<const PhotoId> photos) const
        -> std::expected<std::vector<FaceId>, core::error>;
    auto verified_set_changed(const char* operation) -> void;

    store::FaceRecordStore& store_;
    index::IdentityIndex& index_;
    index::RebuildCoordinator& coordinator_;
    ServiceParams params_;
    cluster::ClusterParams cluster_params_;
    std::unique_ptr<core::ThreadPool> cluster_pool_;
};

} // namespace visage::service
