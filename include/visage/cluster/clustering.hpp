#pragma once

/** \file clustering.hpp
 *  \brief Threshold-graph clustering of unassigned face descriptors.
 *
 * Faces are vertices; an edge joins two faces whose cosine similarity is at
 * least the threshold. Connected components are the clusters, so the
 * partition is exact and single-linkage.
 *
 * Determinism: the result depends only on the set of input entries, never on
 * their order. Members are sorted by face id; clusters are ordered by size
 * (descending), then by smallest member id.
 *
 * Complexity: O(n^2 * dim) similarity evaluations, parallelised over rows
 * when a ThreadPool is supplied.
 */

#include <cstddef>
#include <expected>
#include <span>
#include <vector>

#include "visage/error.hpp"
#include "visage/store/face_record.hpp"

namespace visage::core { class ThreadPool; }

namespace visage::cluster {

/** \brief Clustering parameters. */
struct ClusterParams {
    float threshold{0.7f};             /**< edge iff similarity >= threshold */
    std::size_t min_cluster_size{1};   /**< drop smaller components (1 keeps singletons) */
};

/** \brief One connected component. */
struct Cluster {
    std::vector<FaceId> members;       /**< ascending */
    std::vector<float> centroid;       /**< normalised mean of member descriptors */
};

/** \brief Partition a pool of descriptors.
 *
 * Errors: validation_failed for duplicate face ids, dimension mismatch,
 * non-finite or zero descriptors (offending ids in error::ids), or a
 * threshold outside [-1, 1].
 */
auto cluster_descriptors(std::span<const store::DescriptorEntry> pool, std::size_t dimension,
                         const ClusterParams& params, core::ThreadPool* threads = nullptr)
    -> std::expected<std::vector<Cluster>, core::error>;

/** \brief Disjoint-set forest with path halving and union by size. */
class DisjointSet {
public:
    explicit DisjointSet(std::size_t n);

    auto find(std::size_t x) noexcept -> std::size_t;
    /** \brief Merge the sets of a and b. Returns false if already merged. */
    auto unite(std::size_t a, std::size_t b) noexcept -> bool;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return parent_.size(); }

private:
    std::vector<std::size_t> parent_;
    std::vector<std::size_t> weight_;
};

} // namespace visage::cluster
