#pragma once

/** \file kmeans.hpp
 *  \brief Spherical k-means used as the coarse quantizer of the IVF index mode.
 *
 * k-means++ seeding followed by Lloyd iterations over row-major float
 * matrices. With spherical == true the centroids are renormalised after every
 * update and points go to the centroid of highest inner product, which for
 * unit inputs is the nearest one by L2 as well.
 *
 * Thread-safety: pure function of its inputs; assignment is parallelised when
 * a ThreadPool is supplied.
 * Determinism: a fixed seed produces reproducible results, with or without a pool.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "visage/error.hpp"

namespace visage::core { class ThreadPool; }

namespace visage::index {

/** \brief K-means clustering parameters. */
struct KmeansParams {
    std::uint32_t k{64};                 /**< Number of clusters */
    std::uint32_t max_iter{20};          /**< Maximum Lloyd iterations */
    float epsilon{1e-4f};                /**< Relative objective change that counts as converged */
    std::uint32_t seed{42};              /**< Random seed */
    bool spherical{true};                /**< Unit centroids, inner-product assignment */
};

/** \brief K-means clustering result. */
struct KmeansResult {
    std::vector<float> centroids;               /**< Cluster centers, row-major [k x dim] */
    std::vector<std::uint32_t> assignments;     /**< Point assignments [n] */
    std::vector<std::uint32_t> cluster_sizes;   /**< Points per cluster [k] */
    float inertia{0.0f};                        /**< Sum of squared L2 distances to assigned centroids */
    std::uint32_t iterations{0};

    [[nodiscard]] auto centroid(std::size_t c, std::size_t dim) const noexcept -> std::span<const float> {
        return {centroids.data() + c * dim, dim};
    }
};

/** \brief Partition n row-major vectors into k clusters.
 *
 * Errors: invalid_argument unless n >= k > 0 and dim > 0.
 * Complexity: O(n * k * dim * iterations)
 */
auto kmeans_cluster(std::span<const float> data, std::size_t dim,
                    const KmeansParams& params, core::ThreadPool* pool = nullptr)
    -> std::expected<KmeansResult, core::error>;

/** \brief k-means++ seeding: each further seed is drawn with probability proportional to D².
 *  Returns k rows, row-major. */
auto kmeans_plusplus_init(std::span<const float> data, std::size_t dim,
                          std::uint32_t k, std::uint32_t seed) -> std::vector<float>;

/** \brief Assign every row to its closest centroid. Returns total squared L2 distance. */
auto kmeans_assign(std::span<const float> data, std::size_t dim,
                   std::span<const float> centroids, bool spherical,
                   std::span<std::uint32_t> assignments,
                   core::ThreadPool* pool = nullptr) -> float;

/** \brief Recompute centroids as member means. Empty clusters keep their centroid. */
auto kmeans_update_centroids(std::span<const float> data, std::size_t dim,
                             std::span<const std::uint32_t> assignments,
                             std::span<float> centroids, bool spherical) -> void;

} // namespace visage::index
