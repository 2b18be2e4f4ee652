/** \file kmeans.cpp
 *  \brief Spherical k-means over row-major matrices.
 */

#include "visage/index/kmeans.hpp"
#include "visage/core/thread_pool.hpp"
#include "visage/kernels/distance.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <string>

namespace visage::index {

namespace {

inline auto row_of(std::span<const float> m, std::size_t i, std::size_t dim) -> std::span<const float> {
    return m.subspan(i * dim, dim);
}

/** Closest centroid to x: max inner product when spherical, min L2 otherwise. */
[[gnu::hot]] auto closest(std::span<const float> x, std::span<const float> centroids,
                          std::size_t dim, bool spherical) -> std::uint32_t {
    const std::size_t k = centroids.size() / dim;
    std::uint32_t best = 0;
    if (spherical) {
        float best_ip = -std::numeric_limits<float>::infinity();
        for (std::size_t c = 0; c < k; ++c) {
            const float ip = kernels::inner_product(x, row_of(centroids, c, dim));
            if (ip > best_ip) {
                best_ip = ip;
                best = static_cast<std::uint32_t>(c);
            }
        }
    } else {
        float best_d = std::numeric_limits<float>::infinity();
        for (std::size_t c = 0; c < k; ++c) {
            const float d = kernels::l2_sq(x, row_of(centroids, c, dim));
            if (d < best_d) {
                best_d = d;
                best = static_cast<std::uint32_t>(c);
            }
        }
    }
    return best;
}

} // anonymous namespace

auto kmeans_plusplus_init(std::span<const float> data, std::size_t dim,
                          std::uint32_t k, std::uint32_t seed) -> std::vector<float> {
    const std::size_t n = data.size() / dim;
    std::vector<float> seeds;
    seeds.reserve(static_cast<std::size_t>(k) * dim);

    std::mt19937 gen(seed);
    auto take = [&](std::size_t i) {
        const auto r = row_of(data, i, dim);
        seeds.insert(seeds.end(), r.begin(), r.end());
    };
    take(std::uniform_int_distribution<std::size_t>(0, n - 1)(gen));

    // d2[i]: squared distance from row i to its nearest seed so far.
    std::vector<double> d2(n, std::numeric_limits<double>::infinity());
    for (std::uint32_t s = 1; s < k; ++s) {
        const auto newest = row_of(seeds, s - 1, dim);
        double total = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            d2[i] = std::min<double>(d2[i], kernels::l2_sq(row_of(data, i, dim), newest));
            total += d2[i];
        }

        std::size_t pick = n - 1;
        if (total > 0.0) {
            double target = std::uniform_real_distribution<double>(0.0, total)(gen);
            for (std::size_t i = 0; i < n; ++i) {
                target -= d2[i];
                if (target < 0.0) {
                    pick = i;
                    break;
                }
            }
        } else {
            // Every row coincides with a seed.
            pick = std::uniform_int_distribution<std::size_t>(0, n - 1)(gen);
        }
        take(pick);
    }
    return seeds;
}

auto kmeans_assign(std::span<const float> data, std::size_t dim,
                   std::span<const float> centroids, bool spherical,
                   std::span<std::uint32_t> assignments,
                   core::ThreadPool* pool) -> float {
    const std::size_t n = data.size() / dim;
    std::vector<float> cost(n);

    auto assign_row = [&](std::size_t i) {
        const auto x = row_of(data, i, dim);
        const std::uint32_t c = closest(x, centroids, dim, spherical);
        assignments[i] = c;
        cost[i] = kernels::l2_sq(x, row_of(centroids, c, dim));
    };
    if (pool != nullptr && n > 1024) {
        pool->parallel_for(0, n, assign_row);
    } else {
        for (std::size_t i = 0; i < n; ++i) assign_row(i);
    }

    double total = 0.0;
    for (float c : cost) total += c;
    return static_cast<float>(total);
}

auto kmeans_update_centroids(std::span<const float> data, std::size_t dim,
                             std::span<const std::uint32_t> assignments,
                             std::span<float> centroids, bool spherical) -> void {
    const std::size_t k = centroids.size() / dim;
    std::vector<double> acc(k * dim, 0.0);
    std::vector<std::size_t> members(k, 0);

    for (std::size_t i = 0; i < assignments.size(); ++i) {
        const std::size_t c = assignments[i];
        ++members[c];
        const auto x = row_of(data, i, dim);
        double* dst = acc.data() + c * dim;
        for (std::size_t d = 0; d < dim; ++d) dst[d] += x[d];
    }

    for (std::size_t c = 0; c < k; ++c) {
        if (members[c] == 0) continue;
        auto out = centroids.subspan(c * dim, dim);
        const double inv = 1.0 / static_cast<double>(members[c]);
        for (std::size_t d = 0; d < dim; ++d) {
            out[d] = static_cast<float>(acc[c * dim + d] * inv);
        }
        if (spherical) (void)kernels::normalize(out);
    }
}

auto kmeans_cluster(std::span<const float> data, std::size_t dim,
                    const KmeansParams& params, core::ThreadPool* pool)
    -> std::expected<KmeansResult, core::error> {
    if (dim == 0 || data.size() % dim != 0) {
        return core::make_error(core::error_code::invalid_argument,
                                "Data is not a whole number of rows", "kmeans");
    }
    const std::size_t n = data.size() / dim;
    if (params.k == 0 || n < params.k) {
        return core::make_error(core::error_code::invalid_argument,
                                "Need 0 < k <= rows (k=" + std::to_string(params.k) +
                                ", rows=" + std::to_string(n) + ")", "kmeans");
    }

    KmeansResult result;
    result.centroids = kmeans_plusplus_init(data, dim, params.k, params.seed);
    if (params.spherical) {
        for (std::uint32_t c = 0; c < params.k; ++c) {
            (void)kernels::normalize(std::span<float>(result.centroids).subspan(c * dim, dim));
        }
    }
    result.assignments.assign(n, 0);

    float previous = std::numeric_limits<float>::infinity();
    while (result.iterations < params.max_iter) {
        const float inertia = kmeans_assign(data, dim, result.centroids, params.spherical,
                                            result.assignments, pool);
        if (std::isfinite(previous) &&
            std::abs(previous - inertia) <= params.epsilon * std::max(previous, 1e-10f)) {
            break;
        }
        previous = inertia;
        kmeans_update_centroids(data, dim, result.assignments, result.centroids, params.spherical);
        ++result.iterations;
    }

    result.inertia = kmeans_assign(data, dim, result.centroids, params.spherical,
                                   result.assignments, pool);
    result.cluster_sizes.assign(params.k, 0);
    for (std::uint32_t a : result.assignments) ++result.cluster_sizes[a];
    return result;
}

} // namespace visage::index
