#pragma once

/** \file identity_index.hpp
 *  \brief Immutable identity snapshots and the process-wide index handle.
 *
 * An IdentitySnapshot holds one row per verified face: a contiguous
 * row-major unit-descriptor matrix with parallel person/face id arrays, and
 * optionally an IVF coarse partition. Snapshots are never mutated after
 * build; IdentityIndex publishes a new one with an atomic pointer swap.
 *
 * Example usage:
 * ```cpp
 * IdentityIndex index({.dimension = 512});
 * auto snap = IdentitySnapshot::build(entries, {.dimension = 512});
 * if (snap) index.replace(*snap);
 * auto m = index.snapshot()->query(descriptor, 0.6f);
 * ```
 *
 * Thread-safety: snapshots are immutable and freely shared. IdentityIndex
 * methods are thread-safe and lock-free on the read path.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "visage/error.hpp"
#include "visage/store/face_record.hpp"

namespace visage::core { class ThreadPool; }

namespace visage::index {

/** \brief Search structure used by a snapshot. */
enum class IndexMode {
    flat,         /**< exact exhaustive scan */
    ivf,          /**< spherical k-means partition, nprobe lists probed */
    auto_select   /**< ivf at or above ivf_min_entries, flat below */
};

auto to_string(IndexMode mode) noexcept -> std::string_view;
auto parse_index_mode(std::string_view s) noexcept -> std::optional<IndexMode>;

/** \brief Snapshot build parameters. */
struct IndexBuildParams {
    std::size_t dimension{512};
    IndexMode mode{IndexMode::flat};
    std::uint32_t nlist{64};              /**< IVF lists */
    std::uint32_t nprobe{8};              /**< IVF lists probed per query */
    float recall_margin{0.05f};           /**< probe results below tau + margin fall back to a full scan */
    std::size_t ivf_min_entries{20000};   /**< auto_select switch-over point */
    std::uint32_t kmeans_iters{20};
    std::uint32_t seed{42};
};

/** \brief Best verified face for a query. */
struct Match {
    PersonId person_id{};
    FaceId face_id{};
    float score{0.0f};    /**< cosine similarity in [-1, 1] */
};

class IdentitySnapshot {
public:
    /** \brief Incremental snapshot construction from a descriptor stream. */
    class Builder {
    public:
        explicit Builder(IndexBuildParams params);

        /** \brief Append one verified entry; validation_failed on bad input. */
        auto add(const store::DescriptorEntry& entry) -> std::expected<void, core::error>;

        /** \brief Seal the snapshot. Trains the IVF partition when requested. */
        auto finish(core::ThreadPool* pool = nullptr)
            -> std::expected<std::shared_ptr<const IdentitySnapshot>, core::error>;

        [[nodiscard]] auto size() const noexcept -> std::size_t { return face_ids_.size(); }

    private:
        IndexBuildParams params_;
        std::vector<float> data_;
        std::vector<PersonId> person_ids_;
        std::vector<FaceId> face_ids_;
    };

    /** \brief Build from a complete entry list. */
    static auto build(std::span<const store::DescriptorEntry> entries, const IndexBuildParams& params,
                      core::ThreadPool* pool = nullptr)
        -> std::expected<std::shared_ptr<const IdentitySnapshot>, core::error>;

    /** \brief Snapshot with no entries. */
    static auto make_empty(const IndexBuildParams& params) -> std::shared_ptr<const IdentitySnapshot>;

    /** \brief Highest-scoring person with score >= threshold, or nullopt.
     *
     * Equal top scores resolve to the smallest person id, then smallest face id.
     * Errors: validation_failed on dimension mismatch or non-finite input.
     */
    auto query(std::span<const float> descriptor, float threshold) const
        -> std::expected<std::optional<Match>, core::error>;

    /** \brief Up to k persons by best face score (desc), person id asc on ties.
     *  Always exhaustive. */
    auto search(std::span<const float> descriptor, std::size_t k) const
        -> std::expected<std::vector<Match>, core::error>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return face_ids_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return face_ids_.empty(); }
    [[nodiscard]] auto dimension() const noexcept -> std::size_t { return params_.dimension; }
    [[nodiscard]] auto person_count() const noexcept -> std::size_t { return person_count_; }
    /** \brief Structure actually built (auto_select resolved). */
    [[nodiscard]] auto mode() const noexcept -> IndexMode { return mode_; }
    [[nodiscard]] auto face_ids() const noexcept -> std::span<const FaceId> { return face_ids_; }
    [[nodiscard]] auto person_ids() const noexcept -> std::span<const PersonId> { return person_ids_; }

private:
    IdentitySnapshot() = default;

    auto prepare_query(std::span<const float> descriptor) const
        -> std::expected<std::vector<float>, core::error>;
    auto row(std::size_t i) const noexcept -> std::span<const float> {
        return {data_.data() + i * params_.dimension, params_.dimension};
    }
    auto scan_all(std::span<const float> q) const -> std::optional<Match>;
    auto scan_probed(std::span<const float> q) const -> std::optional<Match>;

    IndexBuildParams params_;
    IndexMode mode_{IndexMode::flat};
    std::vector<float> data_;
    std::vector<PersonId> person_ids_;
    std::vector<FaceId> face_ids_;
    std::size_t person_count_{0};

    // IVF
    std::vector<float> centroids_;                     // [nlist x dim]
    std::vector<std::vector<std::uint32_t>> lists_;    // row indices per list
};

/** \brief Process-wide handle on the current snapshot. */
class IdentityIndex {
public:
    explicit IdentityIndex(IndexBuildParams params);

    /** \brief Current snapshot; never null. Holding it keeps it alive. */
    auto snapshot() const -> std::shared_ptr<const IdentitySnapshot>;

    /** \brief Publish a new snapshot and mark the index healthy. */
    auto replace(std::shared_ptr<const IdentitySnapshot> next) -> void;

    /** \brief Record a failed rebuild; the current snapshot keeps serving. */
    auto mark_failed(core::error err) -> void;

    /** \brief index_unavailable while the last rebuild attempt failed. */
    auto status() const -> std::expected<void, core::error>;

    /** \brief Number of snapshots published by replace(). */
    [[nodiscard]] auto generation() const noexcept -> std::uint64_t {
        return generation_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto params() const noexcept -> const IndexBuildParams& { return params_; }

private:
    IndexBuildParams params_;
    std::atomic<std::shared_ptr<const IdentitySnapshot>> current_;
    std::atomic<std::uint64_t> generation_{0};
    mutable std::mutex health_mutex_;
    std::optional<core::error> last_failure_;
};

} // namespace visage::index
