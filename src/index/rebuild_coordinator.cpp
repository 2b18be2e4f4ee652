/** \file rebuild_coordinator.cpp
 *  \brief Background rebuild worker for the identity index.
 */

#include "visage/index/rebuild_coordinator.hpp"
#include "visage/core/logging.hpp"
#include "visage/core/thread_pool.hpp"

#include <algorithm>
#include <iterator>

namespace visage::index {

RebuildCoordinator::RebuildCoordinator(const store::FaceRecordStore& store, IdentityIndex& index,
                                       RebuildParams params)
    : store_(store)
    , index_(index)
    , params_(params) {
    if (params_.build_threads > 0) {
        build_pool_ = std::make_unique<core::ThreadPool>(params_.build_threads);
    }
    if (params_.cancel_check_interval == 0) params_.cancel_check_interval = 1;
    worker_ = std::thread([this] { worker_loop(); });
}

RebuildCoordinator::~RebuildCoordinator() {
    stop();
}

auto RebuildCoordinator::request_rebuild() -> Ticket {
    std::lock_guard lock(mutex_);
    ++stats_.requests;
    const Ticket ticket = ++last_ticket_;
    if (dirty_) ++stats_.coalesced;
    dirty_ = true;
    if (stop_) {
        retry_pending_ = true;
        return ticket;
    }
    work_cv_.notify_one();
    return ticket;
}

auto RebuildCoordinator::wait(Ticket ticket, std::chrono::milliseconds timeout)
    -> std::expected<void, core::error> {
    std::unique_lock lock(mutex_);
    auto ready = [&] { return stop_ || finished_through_ >= ticket; };
    if (timeout == std::chrono::milliseconds::max()) {
        done_cv_.wait(lock, ready);
    } else if (!done_cv_.wait_for(lock, timeout, ready)) {
        return core::make_error(core::error_code::cancelled,
                                "Timed out waiting for index rebuild", "rebuild.wait");
    }
    if (finished_through_ < ticket) {
        return core::make_error(core::error_code::cancelled,
                                "Rebuild coordinator stopped", "rebuild.wait");
    }
    if (outcomes_.empty()) return {};
    auto it = outcomes_.lower_bound(ticket);
    if (it == outcomes_.end()) it = std::prev(outcomes_.end());
    if (it->second) return std::unexpected(*it->second);
    return {};
}

auto RebuildCoordinator::set_listener(std::shared_ptr<RebuildListener> listener) -> void {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

auto RebuildCoordinator::stop() -> void {
    {
        std::lock_guard lock(mutex_);
        if (!stop_) {
            stop_ = true;
            cancel_.store(true, std::memory_order_release);
            if (dirty_ || running_) retry_pending_ = true;
        }
    }
    work_cv_.notify_all();
    done_cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

auto RebuildCoordinator::stats() const -> RebuildStats {
    std::lock_guard lock(mutex_);
    RebuildStats s = stats_;
    s.running = running_;
    s.dirty = dirty_;
    s.retry_pending = retry_pending_;
    return s;
}

auto RebuildCoordinator::record_outcome(Ticket target, std::optional<core::error> err) -> void {
    finished_through_ = std::max(finished_through_, target);
    outcomes_[target] = std::move(err);
    while (outcomes_.size() > kOutcomeHistory) outcomes_.erase(outcomes_.begin());
}

auto RebuildCoordinator::run_rebuild() -> std::expected<std::size_t, core::error> {
    auto cursor = store_.verified_descriptors();
    if (!cursor) return std::unexpected(cursor.error());

    IdentitySnapshot::Builder builder(index_.params());
    std::size_t consumed = 0;
    while (true) {
        if (consumed % params_.cancel_check_interval == 0 &&
            cancel_.load(std::memory_order_acquire)) {
            return core::make_error(core::error_code::cancelled, "Rebuild interrupted", "rebuild");
        }
        auto entry = (*cursor)->next();
        if (!entry) return std::unexpected(entry.error());
        if (!*entry) break;
        if (auto r = builder.add(**entry); !r) return std::unexpected(r.error());
        ++consumed;
    }

    auto snapshot = builder.finish(build_pool_.get());
    if (!snapshot) return std::unexpected(snapshot.error());
    if (cancel_.load(std::memory_order_acquire)) {
        return core::make_error(core::error_code::cancelled, "Rebuild interrupted", "rebuild");
    }
    const std::size_t entries = (*snapshot)->size();
    index_.replace(std::move(*snapshot));
    return entries;
}

auto RebuildCoordinator::worker_loop() -> void {
#if defined(__linux__)
    pthread_setname_np(pthread_self(), "visage-rebuild");
#endif
    std::unique_lock lock(mutex_);
    while (true) {
        auto has_work = [this] { return stop_ || dirty_; };
        if (retry_at_) {
            work_cv_.wait_until(lock, *retry_at_, has_work);
        } else {
            work_cv_.wait(lock, has_work);
        }
        if (stop_) break;
        if (!dirty_) {
            if (!retry_at_ || std::chrono::steady_clock::now() < *retry_at_) continue;
            core::logger().info("[rebuild] retrying after backoff");
        }
        retry_at_.reset();

        const Ticket target = last_ticket_;
        dirty_ = false;
        running_ = true;
        ++stats_.started;
        lock.unlock();

        const auto t0 = std::chrono::steady_clock::now();
        auto result = run_rebuild();
        const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();

        lock.lock();
        running_ = false;
        auto listener = listener_;
        const bool interrupted = !result && result.error().code == core::error_code::cancelled;
        std::uint32_t consecutive = 0;

        if (result) {
            ++stats_.succeeded;
            stats_.consecutive_failures = 0;
            retry_pending_ = false;
            record_outcome(target, std::nullopt);
            core::logger().debug("[rebuild] generation {} with {} entries in {} ms",
                                 index_.generation(), *result, elapsed_ms);
        } else if (interrupted) {
            ++stats_.cancelled;
            retry_pending_ = true;
            core::logger().info("[rebuild] interrupted; retry pending");
        } else {
            ++stats_.failed;
            consecutive = ++stats_.consecutive_failures;
            retry_pending_ = true;
            record_outcome(target, result.error());
            index_.mark_failed(result.error());
            if (params_.retry_backoff.count() > 0) {
                retry_at_ = std::chrono::steady_clock::now() + params_.retry_backoff;
            }
            if (consecutive >= params_.escalate_after) {
                core::logger().critical("[rebuild] failed {} times in a row ({}): {}", consecutive,
                                        core::to_string(result.error().code), result.error().message);
            } else {
                core::logger().warn("[rebuild] failed ({}): {}; previous snapshot still serving",
                                    core::to_string(result.error().code), result.error().message);
            }
        }
        done_cv_.notify_all();

        if (listener && !interrupted) {
            lock.unlock();
            if (result) {
                listener->on_rebuild_succeeded(index_.generation(), *result);
            } else {
                listener->on_rebuild_failed(result.error(), consecutive);
            }
            lock.lock();
        }
    }
}

} // namespace visage::index
