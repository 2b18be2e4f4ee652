/** \file identity_service.cpp
 *  \brief IdentityService: store mutations plus single rebuild requests.
 */

#include "visage/service/identity_service.hpp"
#include "visage/core/logging.hpp"
#include "visage/core/thread_pool.hpp"

#include <algorithm>
#include <cmath>

namespace visage::service {

IdentityService::IdentityService(store::FaceRecordStore& store, index::IdentityIndex& index,
                                 index::RebuildCoordinator& coordinator, ServiceParams params,
                                 cluster::ClusterParams cluster_params)
    : store_(store)
    , index_(index)
    , coordinator_(coordinator)
    , params_(params)
    , cluster_params_(cluster_params) {
    if (params_.cluster_threads > 0) {
        cluster_pool_ = std::make_unique<core::ThreadPool>(params_.cluster_threads);
    }
}

IdentityService::~IdentityService() = default;

auto IdentityService::check_threshold(float t, const char* component) const
    -> std::expected<void, core::error> {
    if (!std::isfinite(t) || t < -1.0f || t > 1.0f) {
        return core::make_error(core::error_code::validation_failed,
                                "Threshold must lie in [-1, 1]", component);
    }
    return {};
}

auto IdentityService::verified_set_changed(const char* operation) -> void {
    const auto ticket = coordinator_.request_rebuild();
    core::logger().debug("[service] {} requested rebuild (ticket {})", operation, ticket);
    if (!params_.synchronous_rebuild) return;
    if (auto r = coordinator_.wait(ticket, params_.sync_timeout); !r) {
        core::logger().warn("[service] rebuild after {} did not complete ({}): {}", operation,
                            core::to_string(r.error().code), r.error().message);
    }
}

// ---- matching ----

auto IdentityService::match_descriptor(std::span<const float> descriptor,
                                       std::optional<float> threshold) const
    -> std::expected<std::optional<index::Match>, core::error> {
    const float tau = threshold.value_or(params_.match_threshold);
    if (auto r = check_threshold(tau, "service.match_descriptor"); !r) return std::unexpected(r.error());
    return index_.snapshot()->query(descriptor, tau);
}

auto IdentityService::suggest(std::span<const float> descriptor, std::size_t k) const
    -> std::expected<std::vector<index::Match>, core::error> {
    return index_.snapshot()->search(descriptor, k);
}

auto IdentityService::index_status() const -> std::expected<void, core::error> {
    return index_.status();
}

// ---- assignment ----

auto IdentityService::record_assignment(FaceId face, PersonId person, bool verified,
                                        std::optional<float> confidence)
    -> std::expected<void, core::error> {
    auto previous = store_.set_assignment(face, person, verified, confidence);
    if (!previous) return std::unexpected(previous.error());

    const bool unchanged = previous->verified == verified &&
                           (!verified || previous->person_id == person);
    if (!unchanged) verified_set_changed("record_assignment");
    return {};
}

auto IdentityService::clear_assignment(FaceId face) -> std::expected<void, core::error> {
    auto previous = store_.clear_assignment(face);
    if (!previous) return std::unexpected(previous.error());
    if (previous->verified) verified_set_changed("clear_assignment");
    return {};
}

auto IdentityService::batch_verify(PersonId person, std::span<const FaceId> faces)
    -> std::expected<std::size_t, core::error> {
    if (faces.empty()) return std::size_t{0};
    auto count = store_.batch_set_verified(faces, person);
    if (!count) return count;
    if (*count > 0) verified_set_changed("batch_verify");
    core::logger().info("[service] verified {} of {} faces for person {}", *count, faces.size(), person);
    return count;
}

auto IdentityService::unlink(PersonId person, FaceId face) -> std::expected<std::size_t, core::error> {
    const FaceId ids[] = {face};
    auto unlinked = store_.unlink_faces(person, ids);
    if (!unlinked) return std::unexpected(unlinked.error());
    const bool any_verified = std::any_of(unlinked->begin(), unlinked->end(),
                                          [](const store::FaceRecord& f) { return f.verified; });
    if (any_verified) verified_set_changed("unlink");
    return unlinked->size();
}

auto IdentityService::delete_person(PersonId person) -> std::expected<store::DeletionSummary, core::error> {
    return delete_person(person, params_.delete_cascade);
}

auto IdentityService::delete_person(PersonId person, store::DeleteCascade policy)
    -> std::expected<store::DeletionSummary, core::error> {
    auto summary = store_.delete_person(person, policy);
    if (!summary) return summary;
    if (summary->removed_verified) verified_set_changed("delete_person");
    core::logger().info("[service] deleted person {} (detached {}, removed {})",
                        person, summary->detached, summary->removed);
    return summary;
}

// ---- clustering ----

auto IdentityService::cluster_unassigned(const store::ClusterScope& scope,
                                         std::optional<float> threshold) const
    -> std::expected<std::vector<cluster::Cluster>, core::error> {
    auto pool = store_.unassigned_descriptors(scope);
    if (!pool) return std::unexpected(pool.error());

    cluster::ClusterParams params = cluster_params_;
    if (threshold) params.threshold = *threshold;
    auto clusters = cluster::cluster_descriptors(*pool, index_.params().dimension, params,
                                                 cluster_pool_.get());
    if (clusters) {
        core::logger().info("[service] clustered {} unassigned faces into {} groups",
                            pool->size(), clusters->size());
    }
    return clusters;
}

auto IdentityService::create_person_from_cluster(const std::string& display_name,
                                                 std::span<const FaceId> faces)
    -> std::expected<store::Person, core::error> {
    if (faces.empty()) {
        return core::make_error(core::error_code::validation_failed,
                                "Cannot create a person from an empty cluster",
                                "service.create_person_from_cluster");
    }
    auto person = store_.create_person_with_faces(store::PersonDraft{display_name, std::nullopt}, faces);
    if (!person) return person;
    verified_set_changed("create_person_from_cluster");
    core::logger().info("[service] created person {} from {} faces", person->id, faces.size());
    return person;
}

// ---- people ----

auto IdentityService::create_person(const store::PersonDraft& draft)
    -> std::expected<store::Person, core::error> {
    return store_.create_person(draft);
}

auto IdentityService::get_person(PersonId person) const -> std::expected<store::Person, core::error> {
    return store_.get_person(person);
}

auto IdentityService::list_people() const
    -> std::expected<std::vector<store::PersonSummary>, core::error> {
    return store_.list_people();
}

auto IdentityService::update_person(PersonId person, const store::PersonUpdate& update)
    -> std::expected<store::Person, core::error> {
    return store_.update_person(person, update);
}

auto IdentityService::update_avatar(PersonId person, std::string avatar_url)
    -> std::expected<store::Person, core::error> {
    store::PersonUpdate update;
    update.avatar_url = std::move(avatar_url);
    return store_.update_person(person, update);
}

auto IdentityService::person_faces(PersonId person) const -> std::expected<PersonFaces, core::error> {
    auto p = store_.get_person(person);
    if (!p) return std::unexpected(p.error());
    auto faces = store_.faces_for_person(person);
    if (!faces) return std::unexpected(faces.error());
    return PersonFaces{std::move(*p), std::move(*faces)};
}

// ---- photo-scoped ----

auto IdentityService::faces_linked_on_photos(PersonId person, std::span<const PhotoId> photos) const
    -> std::expected<std::vector<FaceId>, core::error> {
    std::vector<FaceId> ids;
    for (PhotoId photo : photos) {
        auto faces = store_.faces_on_photo(photo);
        if (!faces) return std::unexpected(faces.error());
        for (const auto& f : *faces) {
            if (f.person_id == person) ids.push_back(f.id);
        }
    }
    return ids;
}

auto IdentityService::verify_on_photo(PersonId person, PhotoId photo)
    -> std::expected<std::size_t, core::error> {
    const PhotoId photos[] = {photo};
    auto ids = faces_linked_on_photos(person, photos);
    if (!ids) return std::unexpected(ids.error());
    if (ids->empty()) {
        return core::make_error(core::error_code::not_found, "No face of this person on the photo",
                                "service.verify_on_photo", {photo});
    }
    auto count = store_.batch_set_verified(*ids, person);
    if (!count) return count;
    if (*count > 0) verified_set_changed("verify_on_photo");
    return count;
}

auto IdentityService::batch_verify_on_photos(PersonId person, std::span<const PhotoId> photos)
    -> std::expected<std::size_t, core::error> {
    if (photos.empty()) return std::size_t{0};
    auto ids = faces_linked_on_photos(person, photos);
    if (!ids) return std::unexpected(ids.error());
    if (ids->empty()) return std::size_t{0};
    auto count = store_.batch_set_verified(*ids, person);
    if (!count) return count;
    if (*count > 0) verified_set_changed("batch_verify_on_photos");
    core::logger().info("[service] verified person {} on {} photos ({} faces)", person, photos.size(), *count);
    return count;
}

auto IdentityService::unlink_from_photo(PersonId person, PhotoId photo)
    -> std::expected<std::size_t, core::error> {
    const PhotoId photos[] = {photo};
    auto ids = faces_linked_on_photos(person, photos);
    if (!ids) return std::unexpected(ids.error());
    if (ids->empty()) return std::size_t{0};
    auto unlinked = store_.unlink_faces(person, *ids);
    if (!unlinked) return std::unexpected(unlinked.error());
    const bool any_verified = std::any_of(unlinked->begin(), unlinked->end(),
                                          [](const store::FaceRecord& f) { return f.verified; });
    if (any_verified) verified_set_changed("unlink_from_photo");
    return unlinked->size();
}

} // namespace visage::service
