/** \file identity_index.cpp
 *  \brief IdentitySnapshot build/query and the IdentityIndex handle.
 */

#include "visage/index/identity_index.hpp"
#include "visage/index/kmeans.hpp"
#include "visage/core/logging.hpp"
#include "visage/kernels/distance.hpp"

#include <algorithm>
#include <numeric>
#include <unordered_map>
#include <unordered_set>

namespace visage::index {

namespace {

/** Strict ordering of candidate matches: higher score, then smaller person, then smaller face. */
inline bool better(const Match& a, const Match& b) noexcept {
    if (a.score != b.score) return a.score > b.score;
    if (a.person_id != b.person_id) return a.person_id < b.person_id;
    return a.face_id < b.face_id;
}

} // anonymous namespace

auto to_string(IndexMode mode) noexcept -> std::string_view {
    switch (mode) {
        case IndexMode::flat: return "flat";
        case IndexMode::ivf: return "ivf";
        case IndexMode::auto_select: return "auto";
    }
    return "unknown";
}

auto parse_index_mode(std::string_view s) noexcept -> std::optional<IndexMode> {
    if (s == "flat") return IndexMode::flat;
    if (s == "ivf") return IndexMode::ivf;
    if (s == "auto") return IndexMode::auto_select;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Builder

IdentitySnapshot::Builder::Builder(IndexBuildParams params)
    : params_(params) {}

auto IdentitySnapshot::Builder::add(const store::DescriptorEntry& entry)
    -> std::expected<void, core::error> {
    if (!entry.person_id) {
        return core::make_error(core::error_code::data_integrity,
                                "Verified face without a person", "index.build", {entry.face_id});
    }
    if (entry.descriptor.size() != params_.dimension) {
        return core::make_error(core::error_code::validation_failed,
                                "Descriptor dimension mismatch", "index.build", {entry.face_id});
    }
    if (!kernels::all_finite(entry.descriptor)) {
        return core::make_error(core::error_code::validation_failed,
                                "Descriptor contains non-finite values", "index.build", {entry.face_id});
    }
    const std::size_t offset = data_.size();
    data_.insert(data_.end(), entry.descriptor.begin(), entry.descriptor.end());
    if (!kernels::normalize(std::span<float>(data_.data() + offset, params_.dimension))) {
        data_.resize(offset);
        return core::make_error(core::error_code::validation_failed,
                                "Descriptor has zero norm", "index.build", {entry.face_id});
    }
    person_ids_.push_back(*entry.person_id);
    face_ids_.push_back(entry.face_id);
    return {};
}

auto IdentitySnapshot::Builder::finish(core::ThreadPool* pool)
    -> std::expected<std::shared_ptr<const IdentitySnapshot>, core::error> {
    std::shared_ptr<IdentitySnapshot> snap(new IdentitySnapshot());
    snap->params_ = params_;
    snap->data_ = std::move(data_);
    snap->person_ids_ = std::move(person_ids_);
    snap->face_ids_ = std::move(face_ids_);
    data_.clear();
    person_ids_.clear();
    face_ids_.clear();

    {
        std::unordered_set<FaceId> seen;
        seen.reserve(snap->face_ids_.size());
        for (FaceId f : snap->face_ids_) {
            if (!seen.insert(f).second) {
                return core::make_error(core::error_code::data_integrity,
                                        "Face appears twice in rebuild scan", "index.build", {f});
            }
        }
        std::unordered_set<PersonId> persons(snap->person_ids_.begin(), snap->person_ids_.end());
        snap->person_count_ = persons.size();
    }

    const std::size_t n = snap->face_ids_.size();
    bool want_ivf = params_.mode == IndexMode::ivf ||
                    (params_.mode == IndexMode::auto_select && n >= params_.ivf_min_entries);
    const auto nlist = static_cast<std::uint32_t>(std::min<std::size_t>(params_.nlist, n));
    if (want_ivf && nlist < 2) want_ivf = false;

    if (want_ivf) {
        KmeansParams kp;
        kp.k = nlist;
        kp.max_iter = params_.kmeans_iters;
        kp.seed = params_.seed;
        kp.spherical = true;
        auto km = kmeans_cluster(snap->data_, params_.dimension, kp, pool);
        if (!km) {
            core::logger().warn("[index] IVF training failed ({}); using flat scan", km.error().message);
        } else {
            snap->mode_ = IndexMode::ivf;
            snap->centroids_ = std::move(km->centroids);
            snap->lists_.assign(nlist, {});
            for (std::size_t i = 0; i < n; ++i) {
                snap->lists_[km->assignments[i]].push_back(static_cast<std::uint32_t>(i));
            }
        }
    }
    return std::shared_ptr<const IdentitySnapshot>(std::move(snap));
}

// ---------------------------------------------------------------------------
// IdentitySnapshot

auto IdentitySnapshot::build(std::span<const store::DescriptorEntry> entries,
                             const IndexBuildParams& params, core::ThreadPool* pool)
    -> std::expected<std::shared_ptr<const IdentitySnapshot>, core::error> {
    Builder builder(params);
    for (const auto& e : entries) {
        if (auto r = builder.add(e); !r) return std::unexpected(r.error());
    }
    return builder.finish(pool);
}

auto IdentitySnapshot::make_empty(const IndexBuildParams& params) -> std::shared_ptr<const IdentitySnapshot> {
    std::shared_ptr<IdentitySnapshot> snap(new IdentitySnapshot());
    snap->params_ = params;
    return snap;
}

auto IdentitySnapshot::prepare_query(std::span<const float> descriptor) const
    -> std::expected<std::vector<float>, core::error> {
    if (descriptor.size() != params_.dimension) {
        return core::make_error(core::error_code::validation_failed,
                                "Query dimension mismatch", "index.query");
    }
    std::vector<float> q(descriptor.begin(), descriptor.end());
    if (!kernels::all_finite(q) || !kernels::normalize(q)) {
        return core::make_error(core::error_code::validation_failed,
                                "Query must be finite and non-zero", "index.query");
    }
    return q;
}

auto IdentitySnapshot::scan_all(std::span<const float> q) const -> std::optional<Match> {
    std::optional<Match> best;
    for (std::size_t i = 0; i < face_ids_.size(); ++i) {
        const Match m{person_ids_[i], face_ids_[i], kernels::unit_similarity(q, row(i))};
        if (!best || better(m, *best)) best = m;
    }
    return best;
}

auto IdentitySnapshot::scan_probed(std::span<const float> q) const -> std::optional<Match> {
    const std::size_t dim = params_.dimension;
    const std::size_t nlist = lists_.size();
    std::vector<std::pair<float, std::uint32_t>> order(nlist);
    for (std::size_t c = 0; c < nlist; ++c) {
        const std::span<const float> centroid(centroids_.data() + c * dim, dim);
        order[c] = {kernels::inner_product(q, centroid), static_cast<std::uint32_t>(c)};
    }
    const std::size_t probes = std::min<std::size_t>(std::max<std::uint32_t>(1, params_.nprobe), nlist);
    std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(probes), order.end(),
                      [](const auto& a, const auto& b) {
                          return a.first != b.first ? a.first > b.first : a.second < b.second;
                      });

    std::optional<Match> best;
    for (std::size_t p = 0; p < probes; ++p) {
        for (std::uint32_t i : lists_[order[p].second]) {
            const Match m{person_ids_[i], face_ids_[i], kernels::unit_similarity(q, row(i))};
            if (!best || better(m, *best)) best = m;
        }
    }
    return best;
}

auto IdentitySnapshot::query(std::span<const float> descriptor, float threshold) const
    -> std::expected<std::optional<Match>, core::error> {
    auto q = prepare_query(descriptor);
    if (!q) return std::unexpected(q.error());
    if (face_ids_.empty()) return std::optional<Match>{};

    std::optional<Match> best;
    if (mode_ == IndexMode::ivf) {
        best = scan_probed(*q);
        if (!best || best->score < threshold + params_.recall_margin) {
            best = scan_all(*q);
        }
    } else {
        best = scan_all(*q);
    }
    if (best && best->score >= threshold) return best;
    return std::optional<Match>{};
}

auto IdentitySnapshot::search(std::span<const float> descriptor, std::size_t k) const
    -> std::expected<std::vector<Match>, core::error> {
    auto q = prepare_query(descriptor);
    if (!q) return std::unexpected(q.error());

    std::unordered_map<PersonId, Match> per_person;
    per_person.reserve(person_count_);
    for (std::size_t i = 0; i < face_ids_.size(); ++i) {
        const Match m{person_ids_[i], face_ids_[i], kernels::unit_similarity(*q, row(i))};
        auto [it, inserted] = per_person.emplace(m.person_id, m);
        if (!inserted && better(m, it->second)) it->second = m;
    }

    std::vector<Match> out;
    out.reserve(per_person.size());
    for (const auto& [person, m] : per_person) out.push_back(m);
    std::sort(out.begin(), out.end(), better);
    if (out.size() > k) out.resize(k);
    return out;
}

// ---------------------------------------------------------------------------
// IdentityIndex

IdentityIndex::IdentityIndex(IndexBuildParams params)
    : params_(params)
    , current_(IdentitySnapshot::make_empty(params)) {}

auto IdentityIndex::snapshot() const -> std::shared_ptr<const IdentitySnapshot> {
    return current_.load(std::memory_order_acquire);
}

auto IdentityIndex::replace(std::shared_ptr<const IdentitySnapshot> next) -> void {
    if (!next) return;
    current_.store(std::move(next), std::memory_order_release);
    generation_.fetch_add(1, std::memory_order_acq_rel);
    std::lock_guard lock(health_mutex_);
    last_failure_.reset();
}

auto IdentityIndex::mark_failed(core::error err) -> void {
    std::lock_guard lock(health_mutex_);
    last_failure_ = std::move(err);
}

auto IdentityIndex::status() const -> std::expected<void, core::error> {
    std::lock_guard lock(health_mutex_);
    if (!last_failure_) return {};
    return core::make_error(core::error_code::index_unavailable,
                            "Serving stale snapshot: " + last_failure_->message, "index",
                            last_failure_->ids);
}

} // namespace visage::index
