#include "visage/cluster/clustering.hpp"
#include "visage/core/logging.hpp"
#include "visage/core/thread_pool.hpp"
#include "visage/kernels/distance.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>

namespace visage::cluster {

DisjointSet::DisjointSet(std::size_t n)
    : parent_(n), weight_(n, 1) {
    std::iota(parent_.begin(), parent_.end(), std::size_t{0});
}

auto DisjointSet::find(std::size_t x) noexcept -> std::size_t {
    while (parent_[x] != x) {
        parent_[x] = parent_[parent_[x]];
        x = parent_[x];
    }
    return x;
}

auto DisjointSet::unite(std::size_t a, std::size_t b) noexcept -> bool {
    a = find(a);
    b = find(b);
    if (a == b) return false;
    if (weight_[a] < weight_[b]) std::swap(a, b);
    parent_[b] = a;
    weight_[a] += weight_[b];
    return true;
}

auto cluster_descriptors(std::span<const store::DescriptorEntry> pool, std::size_t dimension,
                         const ClusterParams& params, core::ThreadPool* threads)
    -> std::expected<std::vector<Cluster>, core::error> {
    if (!std::isfinite(params.threshold) || params.threshold < -1.0f || params.threshold > 1.0f) {
        return core::make_error(core::error_code::validation_failed,
                                "Cluster threshold must lie in [-1, 1]", "cluster");
    }
    if (pool.empty()) return std::vector<Cluster>{};
    if (dimension == 0) {
        return core::make_error(core::error_code::validation_failed, "Dimension must be > 0", "cluster");
    }

    // Canonical order: ascending face id.
    std::vector<std::size_t> order(pool.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::sort(order.begin(), order.end(),
              [&](std::size_t a, std::size_t b) { return pool[a].face_id < pool[b].face_id; });

    std::vector<std::uint64_t> duplicates;
    std::vector<std::uint64_t> malformed;
    for (std::size_t i = 0; i < order.size(); ++i) {
        const auto& e = pool[order[i]];
        if (i > 0 && pool[order[i - 1]].face_id == e.face_id) {
            if (duplicates.empty() || duplicates.back() != e.face_id) duplicates.push_back(e.face_id);
        }
        if (e.descriptor.size() != dimension || !kernels::all_finite(e.descriptor)) {
            malformed.push_back(e.face_id);
        }
    }
    if (!duplicates.empty()) {
        return core::make_error(core::error_code::validation_failed,
                                "Duplicate face ids in clustering pool", "cluster", std::move(duplicates));
    }
    if (!malformed.empty()) {
        return core::make_error(core::error_code::validation_failed,
                                "Descriptor dimension mismatch or non-finite values", "cluster",
                                std::move(malformed));
    }

    const std::size_t n = order.size();
    std::vector<float> data(n * dimension);
    for (std::size_t i = 0; i < n; ++i) {
        const auto& src = pool[order[i]].descriptor;
        std::span<float> dst(data.data() + i * dimension, dimension);
        std::copy(src.begin(), src.end(), dst.begin());
        if (!kernels::normalize(dst)) {
            return core::make_error(core::error_code::validation_failed,
                                    "Descriptor has zero norm", "cluster", {pool[order[i]].face_id});
        }
    }
    auto row = [&](std::size_t i) {
        return std::span<const float>(data.data() + i * dimension, dimension);
    };

    // Edge discovery: row i lists its neighbours j > i.
    std::vector<std::vector<std::uint32_t>> neighbours(n);
    auto scan_row = [&](std::size_t i) {
        const auto a = row(i);
        for (std::size_t j = i + 1; j < n; ++j) {
            if (kernels::unit_similarity(a, row(j)) >= params.threshold) {
                neighbours[i].push_back(static_cast<std::uint32_t>(j));
            }
        }
    };
    if (threads && n > 256) {
        threads->parallel_for(0, n, scan_row, 16);
    } else {
        for (std::size_t i = 0; i < n; ++i) scan_row(i);
    }

    DisjointSet sets(n);
    std::size_t edges = 0;
    for (std::size_t i = 0; i < n; ++i) {
        for (std::uint32_t j : neighbours[i]) sets.unite(i, j);
        edges += neighbours[i].size();
    }

    // Components, members ascending because i ascends.
    std::unordered_map<std::size_t, std::size_t> slot_of_root;
    std::vector<std::vector<std::size_t>> components;
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t root = sets.find(i);
        auto [it, inserted] = slot_of_root.emplace(root, components.size());
        if (inserted) components.emplace_back();
        components[it->second].push_back(i);
    }

    std::vector<Cluster> clusters;
    clusters.reserve(components.size());
    for (const auto& rows : components) {
        if (rows.size() < std::max<std::size_t>(1, params.min_cluster_size)) continue;
        Cluster c;
        c.members.reserve(rows.size());
        std::vector<double> sum(dimension, 0.0);
        for (std::size_t i : rows) {
            c.members.push_back(pool[order[i]].face_id);
            const auto r = row(i);
            for (std::size_t d = 0; d < dimension; ++d) sum[d] += r[d];
        }
        c.centroid.resize(dimension);
        for (std::size_t d = 0; d < dimension; ++d) {
            c.centroid[d] = static_cast<float>(sum[d] / static_cast<double>(rows.size()));
        }
        if (!kernels::normalize(c.centroid)) {
            // Members cancel out exactly; fall back to the first member.
            const auto r = row(rows.front());
            std::copy(r.begin(), r.end(), c.centroid.begin());
        }
        clusters.push_back(std::move(c));
    }

    std::sort(clusters.begin(), clusters.end(), [](const Cluster& a, const Cluster& b) {
        if (a.members.size() != b.members.size()) return a.members.size() > b.members.size();
        return a.members.front() < b.members.front();
    });

    core::logger().debug("[cluster] {} faces, {} edges, {} clusters at threshold {:.3f}",
                         n, edges, clusters.size(), params.threshold);
    return clusters;
}

} // namespace visage::cluster
