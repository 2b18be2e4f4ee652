#pragma once

/** \file rebuild_coordinator.hpp
 *  \brief Single-flight background rebuild of the identity index.
 *
 * One worker thread. request_rebuild() never blocks on the build:
 * - idle: a rebuild starts immediately;
 * - running: the request marks the coordinator dirty and exactly one more
 *   rebuild runs after the current one, however many requests arrived.
 * A rebuild scans every verified descriptor from the store, builds a fresh
 * snapshot and swaps it into the index. A failed rebuild leaves the previous
 * snapshot serving, sets retry_pending and is reported through the logger and
 * the optional RebuildListener; it is never returned to the mutation that
 * requested it.
 *
 * Thread-safety: all public methods are thread-safe.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "visage/error.hpp"
#include "visage/index/identity_index.hpp"
#include "visage/store/face_record_store.hpp"

namespace visage::core { class ThreadPool; }

namespace visage::index {

/** \brief Rebuild coordinator parameters. */
struct RebuildParams {
    /** Retry a failed rebuild after this delay without waiting for a new trigger (0 = off). */
    std::chrono::milliseconds retry_backoff{0};
    /** Consecutive failures at which failures are logged as critical. */
    std::uint32_t escalate_after{3};
    /** Worker threads for IVF training (0 = train on the rebuild thread). */
    std::size_t build_threads{0};
    /** Entries consumed between cancellation checks. */
    std::size_t cancel_check_interval{256};
};

/** \brief Optional sink for rebuild outcomes. Called on the worker thread. */
class RebuildListener {
public:
    virtual ~RebuildListener() = default;
    virtual void on_rebuild_succeeded(std::uint64_t /*generation*/, std::size_t /*entries*/) {}
    virtual void on_rebuild_failed(const core::error& /*err*/, std::uint32_t /*consecutive*/) {}
};

/** \brief Coordinator counters. */
struct RebuildStats {
    std::uint64_t requests{0};
    std::uint64_t started{0};
    std::uint64_t succeeded{0};
    std::uint64_t failed{0};
    std::uint64_t cancelled{0};
    std::uint64_t coalesced{0};              /**< requests absorbed by an already-pending rebuild */
    std::uint32_t consecutive_failures{0};
    bool running{false};
    bool dirty{false};
    bool retry_pending{false};
};

class RebuildCoordinator {
public:
    using Ticket = std::uint64_t;

    static constexpr std::size_t kOutcomeHistory = 64;

    /** \brief Start the worker. store and index must outlive the coordinator. */
    RebuildCoordinator(const store::FaceRecordStore& store, IdentityIndex& index,
                       RebuildParams params = {});
    ~RebuildCoordinator();

    RebuildCoordinator(const RebuildCoordinator&) = delete;
    RebuildCoordinator& operator=(const RebuildCoordinator&) = delete;

    /** \brief Ask for the index to be brought up to date. Returns a ticket for wait(). */
    auto request_rebuild() -> Ticket;

    /** \brief Block until a rebuild attempt started after ticket was issued has finished.
     *
     * Returns the error of the first attempt that covered ticket, even if later
     * attempts have finished since; cancelled on timeout or stop(). Outcomes of
     * the last kOutcomeHistory attempts are kept; an older ticket reports the
     * oldest outcome still recorded.
     */
    auto wait(Ticket ticket, std::chrono::milliseconds timeout = std::chrono::milliseconds::max())
        -> std::expected<void, core::error>;

    /** \brief Replace the outcome sink (nullptr clears it). */
    auto set_listener(std::shared_ptr<RebuildListener> listener) -> void;

    /** \brief Interrupt a running rebuild between batches and join the worker.
     *  Idempotent. Leaves retry_pending set if work was outstanding. */
    auto stop() -> void;

    auto stats() const -> RebuildStats;

private:
    auto worker_loop() -> void;
    auto run_rebuild() -> std::expected<std::size_t, core::error>;
    auto record_outcome(Ticket target, std::optional<core::error> err) -> void;  // mutex_ held

    const store::FaceRecordStore& store_;
    IdentityIndex& index_;
    RebuildParams params_;
    std::unique_ptr<core::ThreadPool> build_pool_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;
    bool stop_{false};
    std::atomic<bool> cancel_{false};

    bool running_{false};
    bool dirty_{false};
    bool retry_pending_{false};
    std::optional<std::chrono::steady_clock::time_point> retry_at_;

    Ticket last_ticket_{0};                  // last ticket handed out
    Ticket finished_through_{0};             // every ticket <= this has a finished attempt
    // Finished attempts keyed by the last ticket each one covered.
    std::map<Ticket, std::optional<core::error>> outcomes_;

    RebuildStats stats_;
    std::shared_ptr<RebuildListener> listener_;
    std::thread worker_;
};

} // namespace visage::index
