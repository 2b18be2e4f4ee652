/** \file memory_face_store.cpp
 *  \brief In-process FaceRecordStore with Roaring-bitmap id sets.
 */

#include "visage/store/memory_face_store.hpp"
#include "visage/kernels/distance.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <deque>
#include <fstream>
#include <limits>
#include <map>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include "roaring.hh"

namespace visage::store {

namespace {

constexpr const char* kComponent = "store.memory";
constexpr char kMagic[4] = {'V', 'S', 'G', 'F'};
constexpr std::uint32_t kFormatVersion = 1;

inline bool fits_u32(std::uint64_t id) noexcept {
    return id <= std::numeric_limits<std::uint32_t>::max();
}

inline auto now_seconds() -> Timestamp {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Serialization helpers
template <typename T>
inline void write_pod(std::ofstream& os, const T& v) {
    os.write(reinterpret_cast<const char*>(&v), sizeof(T));
}

template <typename T>
inline bool read_pod(std::ifstream& is, T& v) {
    return static_cast<bool>(is.read(reinterpret_cast<char*>(&v), sizeof(T)));
}

inline void write_string(std::ofstream& os, const std::string& s) {
    write_pod(os, static_cast<std::uint64_t>(s.size()));
    os.write(s.data(), static_cast<std::streamsize>(s.size()));
}

inline bool read_string(std::ifstream& is, std::string& out) {
    std::uint64_t n{};
    if (!read_pod(is, n)) return false;
    if (n > (1u << 20)) return false;
    out.resize(static_cast<std::size_t>(n));
    return static_cast<bool>(is.read(out.data(), static_cast<std::streamsize>(n)));
}

template <typename T>
inline void write_optional(std::ofstream& os, const std::optional<T>& v) {
    write_pod(os, static_cast<std::uint8_t>(v.has_value()));
    if (v) write_pod(os, *v);
}

template <typename T>
inline bool read_optional(std::ifstream& is, std::optional<T>& v) {
    std::uint8_t has{};
    if (!read_pod(is, has)) return false;
    if (!has) { v.reset(); return true; }
    T x{};
    if (!read_pod(is, x)) return false;
    v = x;
    return true;
}

auto sorted_unique(std::span<const FaceId> ids) -> std::vector<FaceId> {
    std::vector<FaceId> out(ids.begin(), ids.end());
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

} // anonymous namespace

class MemoryFaceStore::Impl {
public:
    explicit Impl(MemoryStoreConfig cfg)
        : config_(cfg)
        , dimension_(cfg.dimension) {
        if (config_.scan_batch_size == 0) config_.scan_batch_size = 1;
    }

    /** Walks verified faces in ascending id order, one batch per lock acquisition. */
    class VerifiedCursor final : public DescriptorCursor {
    public:
        explicit VerifiedCursor(std::shared_ptr<const Impl> impl)
            : impl_(std::move(impl)) {}

        auto next() -> std::expected<std::optional<DescriptorEntry>, core::error> override {
            if (buffer_.empty() && !exhausted_) {
                auto batch = impl_->verified_batch(last_, impl_->config_.scan_batch_size);
                if (batch.size() < impl_->config_.scan_batch_size) exhausted_ = true;
                for (auto& e : batch) buffer_.push_back(std::move(e));
            }
            if (buffer_.empty()) return std::optional<DescriptorEntry>{};
            DescriptorEntry e = std::move(buffer_.front());
            buffer_.pop_front();
            last_ = e.face_id;
            return std::optional<DescriptorEntry>{std::move(e)};
        }

    private:
        std::shared_ptr<const Impl> impl_;
        std::deque<DescriptorEntry> buffer_;
        std::optional<FaceId> last_;
        bool exhausted_{false};
    };

    // ---- ingest ----

    auto add_photo(const Photo& photo) -> std::expected<void, core::error> {
        std::unique_lock lock(mutex_);
        auto it = photos_.find(photo.id);
        if (it != photos_.end()) {
            if (it->second.gallery_id == photo.gallery_id) return {};
            return core::make_error(core::error_code::validation_failed,
                                    "Photo already registered under a different gallery",
                                    "store.memory.add_photo");
        }
        photos_.emplace(photo.id, photo);
        return {};
    }

    auto add_face(const FaceRecord& face) -> std::expected<void, core::error> {
        if (!fits_u32(face.id)) {
            return core::make_error(core::error_code::invalid_argument,
                                    "Face id exceeds 32-bit limit required by Roaring",
                                    "store.memory.add_face", {face.id});
        }
        FaceRecord rec = face;
        if (rec.descriptor.empty() || !kernels::all_finite(rec.descriptor) ||
            !kernels::normalize(rec.descriptor)) {
            return core::make_error(core::error_code::validation_failed,
                                    "Descriptor must be non-empty, finite and non-zero",
                                    "store.memory.add_face", {face.id});
        }
        rec.person_id.reset();
        rec.verified = false;
        rec.recognition_confidence.reset();

        std::unique_lock lock(mutex_);
        if (dimension_ != 0 && rec.descriptor.size() != dimension_) {
            return core::make_error(core::error_code::validation_failed,
                                    "Descriptor dimension mismatch",
                                    "store.memory.add_face", {face.id});
        }
        if (photos_.find(rec.photo_id) == photos_.end()) {
            return core::make_error(core::error_code::not_found, "Photo not found",
                                    "store.memory.add_face", {rec.photo_id});
        }
        if (faces_.find(rec.id) != faces_.end()) {
            return core::make_error(core::error_code::validation_failed, "Face id already exists",
                                    "store.memory.add_face", {rec.id});
        }
        if (dimension_ == 0) dimension_ = rec.descriptor.size();

        const auto id32 = static_cast<std::uint32_t>(rec.id);
        faces_by_photo_[rec.photo_id].add(id32);
        unassigned_.add(id32);
        faces_.emplace(rec.id, std::move(rec));
        return {};
    }

    auto remove_photo(PhotoId photo) -> std::expected<std::vector<FaceRecord>, core::error> {
        std::unique_lock lock(mutex_);
        if (photos_.find(photo) == photos_.end()) {
            return core::make_error(core::error_code::not_found, "Photo not found",
                                    "store.memory.remove_photo", {photo});
        }
        std::vector<FaceRecord> removed;
        if (auto it = faces_by_photo_.find(photo); it != faces_by_photo_.end()) {
            const roaring::Roaring ids = it->second;
            for (auto id : ids) {
                removed.push_back(erase_face_locked(id));
            }
            faces_by_photo_.erase(photo);
        }
        photos_.erase(photo);
        return removed;
    }

    // ---- people ----

    auto create_person(const PersonDraft& draft) -> std::expected<Person, core::error> {
        if (draft.display_name.empty()) {
            return core::make_error(core::error_code::validation_failed,
                                    "Person display name must not be empty",
                                    "store.memory.create_person");
        }
        std::unique_lock lock(mutex_);
        return create_person_locked(draft);
    }

    auto get_person(PersonId id) const -> std::expected<Person, core::error> {
        std::shared_lock lock(mutex_);
        auto it = people_.find(id);
        if (it == people_.end()) {
            return core::make_error(core::error_code::not_found, "Person not found",
                                    "store.memory.get_person", {id});
        }
        return it->second;
    }

    auto list_people() const -> std::vector<PersonSummary> {
        std::shared_lock lock(mutex_);
        std::vector<PersonSummary> out;
        out.reserve(people_.size());
        for (const auto& [id, person] : people_) {
            PersonSummary s{person, 0, 0};
            if (auto it = faces_by_person_.find(id); it != faces_by_person_.end()) {
                s.face_count = static_cast<std::size_t>(it->second.cardinality());
                s.verified_count = static_cast<std::size_t>(it->second.and_cardinality(verified_));
            }
            out.push_back(std::move(s));
        }
        return out;
    }

    auto update_person(PersonId id, const PersonUpdate& update) -> std::expected<Person, core::error> {
        if (update.display_name && update.display_name->empty()) {
            return core::make_error(core::error_code::validation_failed,
                                    "Person display name must not be empty",
                                    "store.memory.update_person", {id});
        }
        std::unique_lock lock(mutex_);
        auto it = people_.find(id);
        if (it == people_.end()) {
            return core::make_error(core::error_code::not_found, "Person not found",
                                    "store.memory.update_person", {id});
        }
        if (update.display_name) it->second.display_name = *update.display_name;
        if (update.avatar_url) it->second.avatar_url = *update.avatar_url;
        return it->second;
    }

    auto delete_person(PersonId id, DeleteCascade policy) -> std::expected<DeletionSummary, core::error> {
        std::unique_lock lock(mutex_);
        if (people_.find(id) == people_.end()) {
            return core::make_error(core::error_code::not_found, "Person not found",
                                    "store.memory.delete_person", {id});
        }
        DeletionSummary summary;
        if (auto it = faces_by_person_.find(id); it != faces_by_person_.end()) {
            const roaring::Roaring linked = it->second;
            summary.removed_verified = linked.and_cardinality(verified_) > 0;
            for (auto face_id : linked) {
                if (policy == DeleteCascade::detach) {
                    unassign_locked(faces_.at(face_id));
                    ++summary.detached;
                } else {
                    (void)erase_face_locked(face_id);
                    ++summary.removed;
                }
            }
        }
        faces_by_person_.erase(id);
        people_.erase(id);
        return summary;
    }

    auto create_person_with_faces(const PersonDraft& draft, std::span<const FaceId> faces)
        -> std::expected<Person, core::error> {
        if (faces.empty()) {
            return core::make_error(core::error_code::validation_failed,
                                    "Cannot create a person from an empty face list",
                                    "store.memory.create_person_with_faces");
        }
        if (draft.display_name.empty()) {
            return core::make_error(core::error_code::validation_failed,
                                    "Person display name must not be empty",
                                    "store.memory.create_person_with_faces");
        }
        const auto ids = sorted_unique(faces);

        std::unique_lock lock(mutex_);
        std::vector<std::uint64_t> offending;
        for (FaceId id : ids) {
            auto it = faces_.find(id);
            if (it == faces_.end() || it->second.person_id) offending.push_back(id);
        }
        if (!offending.empty()) {
            return core::make_error(core::error_code::validation_failed,
                                    "Faces are unknown or already assigned",
                                    "store.memory.create_person_with_faces", std::move(offending));
        }
        auto person = create_person_locked(draft);
        if (!person) return std::unexpected(person.error());
        for (FaceId id : ids) {
            assign_locked(faces_.at(id), person->id, true, 1.0f);
        }
        return person;
    }

    // ---- faces ----

    auto get_face(FaceId id) const -> std::expected<FaceRecord, core::error> {
        std::shared_lock lock(mutex_);
        auto it = faces_.find(id);
        if (it == faces_.end()) {
            return core::make_error(core::error_code::not_found, "Face not found",
                                    "store.memory.get_face", {id});
        }
        return it->second;
    }

    auto faces_for_person(PersonId id) const -> std::expected<std::vector<FaceRecord>, core::error> {
        std::shared_lock lock(mutex_);
        if (people_.find(id) == people_.end()) {
            return core::make_error(core::error_code::not_found, "Person not found",
                                    "store.memory.faces_for_person", {id});
        }
        std::vector<FaceRecord> out;
        if (auto it = faces_by_person_.find(id); it != faces_by_person_.end()) {
            out.reserve(static_cast<std::size_t>(it->second.cardinality()));
            for (auto face_id : it->second) out.push_back(faces_.at(face_id));
        }
        return out;
    }

    auto faces_on_photo(PhotoId id) const -> std::expected<std::vector<FaceRecord>, core::error> {
        std::shared_lock lock(mutex_);
        if (photos_.find(id) == photos_.end()) {
            return core::make_error(core::error_code::not_found, "Photo not found",
                                    "store.memory.faces_on_photo", {id});
        }
        std::vector<FaceRecord> out;
        if (auto it = faces_by_photo_.find(id); it != faces_by_photo_.end()) {
            for (auto face_id : it->second) out.push_back(faces_.at(face_id));
        }
        return out;
    }

    auto set_assignment(FaceId face, PersonId person, bool verified, std::optional<float> confidence)
        -> std::expected<FaceRecord, core::error> {
        if (confidence && (!std::isfinite(*confidence) || *confidence < 0.0f || *confidence > 1.0f)) {
            return core::make_error(core::error_code::validation_failed,
                                    "Recognition confidence must lie in [0, 1]",
                                    "store.memory.set_assignment", {face});
        }
        std::unique_lock lock(mutex_);
        auto it = faces_.find(face);
        if (it == faces_.end()) {
            return core::make_error(core::error_code::not_found, "Face not found",
                                    "store.memory.set_assignment", {face});
        }
        if (people_.find(person) == people_.end()) {
            return core::make_error(core::error_code::not_found, "Person not found",
                                    "store.memory.set_assignment", {person});
        }
        FaceRecord previous = it->second;
        assign_locked(it->second, person, verified, verified ? std::optional<float>(1.0f) : confidence);
        return previous;
    }

    auto clear_assignment(FaceId face) -> std::expected<FaceRecord, core::error> {
        std::unique_lock lock(mutex_);
        auto it = faces_.find(face);
        if (it == faces_.end()) {
            return core::make_error(core::error_code::not_found, "Face not found",
                                    "store.memory.clear_assignment", {face});
        }
        FaceRecord previous = it->second;
        if (previous.person_id) unassign_locked(it->second);
        return previous;
    }

    auto batch_set_verified(std::span<const FaceId> faces, PersonId person)
        -> std::expected<std::size_t, core::error> {
        const auto ids = sorted_unique(faces);
        std::unique_lock lock(mutex_);
        if (people_.find(person) == people_.end()) {
            return core::make_error(core::error_code::not_found, "Person not found",
                                    "store.memory.batch_set_verified", {person});
        }
        std::size_t count = 0;
        for (FaceId id : ids) {
            auto it = faces_.find(id);
            if (it == faces_.end() || it->second.person_id != person) continue;
            assign_locked(it->second, person, true, 1.0f);
            ++count;
        }
        return count;
    }

    auto unlink_faces(PersonId person, std::span<const FaceId> faces)
        -> std::expected<std::vector<FaceRecord>, core::error> {
        const auto ids = sorted_unique(faces);
        std::unique_lock lock(mutex_);
        if (people_.find(person) == people_.end()) {
            return core::make_error(core::error_code::not_found, "Person not found",
                                    "store.memory.unlink_faces", {person});
        }
        std::vector<FaceRecord> unlinked;
        for (FaceId id : ids) {
            auto it = faces_.find(id);
            if (it == faces_.end() || it->second.person_id != person) continue;
            unlinked.push_back(it->second);
            unassign_locked(it->second);
        }
        return unlinked;
    }

    // ---- scans ----

    /** \brief Copy up to limit verified entries with face id > after (or from the
     *  beginning when after is empty). */
    auto verified_batch(std::optional<FaceId> after, std::size_t limit) const
        -> std::vector<DescriptorEntry> {
        std::shared_lock lock(mutex_);
        std::vector<DescriptorEntry> out;
        auto it = after ? faces_.upper_bound(*after) : faces_.begin();
        for (; it != faces_.end() && out.size() < limit; ++it) {
            const auto& rec = it->second;
            if (!rec.verified) continue;
            out.push_back(DescriptorEntry{rec.id, rec.person_id, rec.descriptor});
        }
        return out;
    }

    auto unassigned_descriptors(const ClusterScope& scope) const
        -> std::expected<std::vector<DescriptorEntry>, core::error> {
        std::shared_lock lock(mutex_);
        roaring::Roaring pool = unassigned_;
        if (scope.gallery_id || !scope.photo_ids.empty()) {
            roaring::Roaring allowed;
            auto add_photo_faces = [&](PhotoId photo) {
                if (auto it = faces_by_photo_.find(photo); it != faces_by_photo_.end()) {
                    allowed |= it->second;
                }
            };
            if (!scope.photo_ids.empty()) {
                std::vector<std::uint64_t> missing;
                for (PhotoId photo : scope.photo_ids) {
                    auto it = photos_.find(photo);
                    if (it == photos_.end()) {
                        missing.push_back(photo);
                        continue;
                    }
                    if (scope.gallery_id && it->second.gallery_id != *scope.gallery_id) continue;
                    add_photo_faces(photo);
                }
                if (!missing.empty()) {
                    return core::make_error(core::error_code::not_found, "Photo not found",
                                            "store.memory.unassigned_descriptors", std::move(missing));
                }
            } else {
                for (const auto& [photo_id, photo] : photos_) {
                    if (photo.gallery_id == *scope.gallery_id) add_photo_faces(photo_id);
                }
            }
            pool &= allowed;
        }

        std::vector<DescriptorEntry> out;
        out.reserve(static_cast<std::size_t>(pool.cardinality()));
        for (auto id : pool) {
            const auto& rec = faces_.at(id);
            out.push_back(DescriptorEntry{rec.id, std::nullopt, rec.descriptor});
        }
        return out;
    }

    auto get_stats() const -> MemoryFaceStore::Stats {
        std::shared_lock lock(mutex_);
        Stats s{};
        s.people = people_.size();
        s.photos = photos_.size();
        s.faces = faces_.size();
        s.verified = static_cast<std::size_t>(verified_.cardinality());
        s.unassigned = static_cast<std::size_t>(unassigned_.cardinality());
        s.memory_usage_bytes = verified_.getSizeInBytes() + unassigned_.getSizeInBytes();
        for (const auto& [id, bm] : faces_by_person_) s.memory_usage_bytes += bm.getSizeInBytes();
        for (const auto& [id, bm] : faces_by_photo_) s.memory_usage_bytes += bm.getSizeInBytes();
        return s;
    }

    auto save(const std::string& path) const -> std::expected<void, core::error> {
        std::shared_lock lock(mutex_);
        std::ofstream os(path, std::ios::binary | std::ios::trunc);
        if (!os) {
            return core::make_error(core::error_code::store_failure,
                                    "Failed to open file for writing", "store.memory.save");
        }
        os.write(kMagic, sizeof(kMagic));
        write_pod(os, kFormatVersion);
        write_pod(os, static_cast<std::uint64_t>(dimension_));
        write_pod(os, next_person_id_);

        write_pod(os, static_cast<std::uint64_t>(people_.size()));
        for (const auto& [id, p] : people_) {
            write_pod(os, id);
            write_string(os, p.display_name);
            write_pod(os, static_cast<std::uint8_t>(p.avatar_url.has_value()));
            if (p.avatar_url) write_string(os, *p.avatar_url);
            write_pod(os, p.created_at);
        }

        write_pod(os, static_cast<std::uint64_t>(photos_.size()));
        for (const auto& [id, ph] : photos_) {
            write_pod(os, id);
            write_pod(os, ph.gallery_id);
        }

        write_pod(os, static_cast<std::uint64_t>(faces_.size()));
        for (const auto& [id, f] : faces_) {
            write_pod(os, id);
            write_pod(os, f.photo_id);
            os.write(reinterpret_cast<const char*>(f.descriptor.data()),
                     static_cast<std::streamsize>(f.descriptor.size() * sizeof(float)));
            write_pod(os, f.bounding_box);
            write_pod(os, f.detection_confidence);
            write_optional(os, f.person_id);
            write_pod(os, static_cast<std::uint8_t>(f.verified));
            write_optional(os, f.recognition_confidence);
        }
        if (!os) {
            return core::make_error(core::error_code::store_failure, "Write failed", "store.memory.save");
        }
        return {};
    }

    auto load(const std::string& path) -> std::expected<void, core::error> {
        std::ifstream is(path, std::ios::binary);
        if (!is) {
            return core::make_error(core::error_code::store_failure,
                                    "Failed to open file for reading", "store.memory.load");
        }
        auto corrupt = [](const char* what) {
            return core::make_error(core::error_code::data_integrity, what, "store.memory.load");
        };

        char magic[4]{};
        std::uint32_t version{};
        std::uint64_t dim{};
        PersonId next_person{};
        if (!is.read(magic, sizeof(magic)) || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
            return corrupt("Bad magic");
        }
        if (!read_pod(is, version) || version != kFormatVersion) return corrupt("Unsupported version");
        if (!read_pod(is, dim) || !read_pod(is, next_person)) return corrupt("Truncated header");

        Impl fresh(config_);
        fresh.dimension_ = static_cast<std::size_t>(dim);
        fresh.next_person_id_ = next_person;

        std::uint64_t n{};
        if (!read_pod(is, n)) return corrupt("Truncated people section");
        for (std::uint64_t i = 0; i < n; ++i) {
            Person p;
            std::uint8_t has_avatar{};
            if (!read_pod(is, p.id) || !read_string(is, p.display_name) || !read_pod(is, has_avatar)) {
                return corrupt("Truncated person");
            }
            if (has_avatar) {
                std::string url;
                if (!read_string(is, url)) return corrupt("Truncated person");
                p.avatar_url = std::move(url);
            }
            if (!read_pod(is, p.created_at)) return corrupt("Truncated person");
            fresh.people_.emplace(p.id, std::move(p));
        }

        if (!read_pod(is, n)) return corrupt("Truncated photo section");
        for (std::uint64_t i = 0; i < n; ++i) {
            Photo ph;
            if (!read_pod(is, ph.id) || !read_pod(is, ph.gallery_id)) return corrupt("Truncated photo");
            fresh.photos_.emplace(ph.id, ph);
        }

        if (!read_pod(is, n)) return corrupt("Truncated face section");
        for (std::uint64_t i = 0; i < n; ++i) {
            FaceRecord f;
            std::uint8_t verified{};
            f.descriptor.resize(static_cast<std::size_t>(dim));
            if (!read_pod(is, f.id) || !read_pod(is, f.photo_id) ||
                !is.read(reinterpret_cast<char*>(f.descriptor.data()),
                         static_cast<std::streamsize>(dim * sizeof(float))) ||
                !read_pod(is, f.bounding_box) || !read_pod(is, f.detection_confidence) ||
                !read_optional(is, f.person_id) || !read_pod(is, verified) ||
                !read_optional(is, f.recognition_confidence)) {
                return corrupt("Truncated face");
            }
            f.verified = verified != 0;
            if (!fits_u32(f.id)) return corrupt("Face id exceeds 32-bit limit");
            if (f.verified && (!f.person_id || f.recognition_confidence != 1.0f)) {
                return corrupt("Verified face without person or full confidence");
            }
            if (f.person_id && fresh.people_.find(*f.person_id) == fresh.people_.end()) {
                return corrupt("Face references unknown person");
            }
            if (fresh.photos_.find(f.photo_id) == fresh.photos_.end()) {
                return corrupt("Face references unknown photo");
            }
            const auto id32 = static_cast<std::uint32_t>(f.id);
            fresh.faces_by_photo_[f.photo_id].add(id32);
            if (f.person_id) {
                fresh.faces_by_person_[*f.person_id].add(id32);
                if (f.verified) fresh.verified_.add(id32);
            } else {
                fresh.unassigned_.add(id32);
            }
            fresh.faces_.emplace(f.id, std::move(f));
        }

        std::unique_lock lock(mutex_);
        dimension_ = fresh.dimension_;
        next_person_id_ = fresh.next_person_id_;
        people_ = std::move(fresh.people_);
        photos_ = std::move(fresh.photos_);
        faces_ = std::move(fresh.faces_);
        faces_by_person_ = std::move(fresh.faces_by_person_);
        faces_by_photo_ = std::move(fresh.faces_by_photo_);
        verified_ = std::move(fresh.verified_);
        unassigned_ = std::move(fresh.unassigned_);
        return {};
    }

private:
    auto create_person_locked(const PersonDraft& draft) -> std::expected<Person, core::error> {
        if (!fits_u32(next_person_id_)) {
            return core::make_error(core::error_code::invalid_argument,
                                    "Person id space exhausted", "store.memory.create_person");
        }
        Person p{next_person_id_++, draft.display_name, draft.avatar_url, now_seconds()};
        people_.emplace(p.id, p);
        return p;
    }

    void assign_locked(FaceRecord& rec, PersonId person, bool verified, std::optional<float> confidence) {
        const auto id32 = static_cast<std::uint32_t>(rec.id);
        if (rec.person_id && *rec.person_id != person) {
            faces_by_person_[*rec.person_id].remove(id32);
        }
        unassigned_.remove(id32);
        faces_by_person_[person].add(id32);
        if (verified) verified_.add(id32); else verified_.remove(id32);
        rec.person_id = person;
        rec.verified = verified;
        rec.recognition_confidence = confidence;
    }

    void unassign_locked(FaceRecord& rec) {
        const auto id32 = static_cast<std::uint32_t>(rec.id);
        if (rec.person_id) {
            if (auto it = faces_by_person_.find(*rec.person_id); it != faces_by_person_.end()) {
                it->second.remove(id32);
            }
        }
        verified_.remove(id32);
        unassigned_.add(id32);
        rec.person_id.reset();
        rec.verified = false;
        rec.recognition_confidence.reset();
    }

    auto erase_face_locked(FaceId id) -> FaceRecord {
        auto node = faces_.extract(id);
        FaceRecord rec = std::move(node.mapped());
        const auto id32 = static_cast<std::uint32_t>(id);
        if (rec.person_id) {
            if (auto it = faces_by_person_.find(*rec.person_id); it != faces_by_person_.end()) {
                it->second.remove(id32);
            }
        }
        if (auto it = faces_by_photo_.find(rec.photo_id); it != faces_by_photo_.end()) {
            it->second.remove(id32);
        }
        verified_.remove(id32);
        unassigned_.remove(id32);
        return rec;
    }

    MemoryStoreConfig config_;
    mutable std::shared_mutex mutex_;
    std::size_t dimension_{0};
    PersonId next_person_id_{1};

    std::map<PersonId, Person> people_;
    std::map<PhotoId, Photo> photos_;
    std::map<FaceId, FaceRecord> faces_;

    std::unordered_map<PersonId, roaring::Roaring> faces_by_person_;
    std::unordered_map<PhotoId, roaring::Roaring> faces_by_photo_;
    roaring::Roaring verified_;
    roaring::Roaring unassigned_;
};

MemoryFaceStore::MemoryFaceStore() : MemoryFaceStore(MemoryStoreConfig{}) {}

MemoryFaceStore::MemoryFaceStore(MemoryStoreConfig config)
    : impl_(std::make_shared<Impl>(config)) {}

MemoryFaceStore::~MemoryFaceStore() = default;
MemoryFaceStore::MemoryFaceStore(MemoryFaceStore&&) noexcept = default;
MemoryFaceStore& MemoryFaceStore::operator=(MemoryFaceStore&&) noexcept = default;

auto MemoryFaceStore::add_photo(const Photo& photo) -> std::expected<void, core::error> {
    return impl_->add_photo(photo);
}

auto MemoryFaceStore::add_face(const FaceRecord& face) -> std::expected<void, core::error> {
    return impl_->add_face(face);
}

auto MemoryFaceStore::remove_photo(PhotoId photo) -> std::expected<std::vector<FaceRecord>, core::error> {
    return impl_->remove_photo(photo);
}

auto MemoryFaceStore::create_person(const PersonDraft& draft) -> std::expected<Person, core::error> {
    return impl_->create_person(draft);
}

auto MemoryFaceStore::get_person(PersonId id) const -> std::expected<Person, core::error> {
    return impl_->get_person(id);
}

auto MemoryFaceStore::list_people() const -> std::expected<std::vector<PersonSummary>, core::error> {
    return impl_->list_people();
}

auto MemoryFaceStore::update_person(PersonId id, const PersonUpdate& update)
    -> std::expected<Person, core::error> {
    return impl_->update_person(id, update);
}

auto MemoryFaceStore::delete_person(PersonId id, DeleteCascade policy)
    -> std::expected<DeletionSummary, core::error> {
    return impl_->delete_person(id, policy);
}

auto MemoryFaceStore::create_person_with_faces(const PersonDraft& draft, std::span<const FaceId> faces)
    -> std::expected<Person, core::error> {
    return impl_->create_person_with_faces(draft, faces);
}

auto MemoryFaceStore::get_face(FaceId id) const -> std::expected<FaceRecord, core::error> {
    return impl_->get_face(id);
}

auto MemoryFaceStore::faces_for_person(PersonId id) const
    -> std::expected<std::vector<FaceRecord>, core::error> {
    return impl_->faces_for_person(id);
}

auto MemoryFaceStore::faces_on_photo(PhotoId id) const
    -> std::expected<std::vector<FaceRecord>, core::error> {
    return impl_->faces_on_photo(id);
}

auto MemoryFaceStore::set_assignment(FaceId face, PersonId person, bool verified,
                                     std::optional<float> confidence)
    -> std::expected<FaceRecord, core::error> {
    return impl_->set_assignment(face, person, verified, confidence);
}

auto MemoryFaceStore::clear_assignment(FaceId face) -> std::expected<FaceRecord, core::error> {
    return impl_->clear_assignment(face);
}

auto MemoryFaceStore::batch_set_verified(std::span<const FaceId> faces, PersonId person)
    -> std::expected<std::size_t, core::error> {
    return impl_->batch_set_verified(faces, person);
}

auto MemoryFaceStore::unlink_faces(PersonId person, std::span<const FaceId> faces)
    -> std::expected<std::vector<FaceRecord>, core::error> {
    return impl_->unlink_faces(person, faces);
}

auto MemoryFaceStore::verified_descriptors() const
    -> std::expected<std::unique_ptr<DescriptorCursor>, core::error> {
    return std::unique_ptr<DescriptorCursor>(std::make_unique<Impl::VerifiedCursor>(impl_));
}

auto MemoryFaceStore::unassigned_descriptors(const ClusterScope& scope) const
    -> std::expected<std::vector<DescriptorEntry>, core::error> {
    return impl_->unassigned_descriptors(scope);
}

auto MemoryFaceStore::get_stats() const -> Stats {
    return impl_->get_stats();
}

auto MemoryFaceStore::save(const std::string& path) const -> std::expected<void, core::error> {
    return impl_->save(path);
}

auto MemoryFaceStore::load(const std::string& path) -> std::expected<void, core::error> {
    return impl_->load(path);
}

} // namespace visage::store
