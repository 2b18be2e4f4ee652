#pragma once

/** \file thread_pool.hpp
 *  \brief Fixed-size FIFO worker pool for the engine's data-parallel passes.
 *
 * Two passes fan work out over it:
 * - the pairwise similarity pass of cluster_descriptors(), one chunk of rows
 *   per task;
 * - kmeans_assign() while IdentitySnapshot::Builder::finish() trains the IVF
 *   coarse partition.
 * Each caller blocks in parallel_for() until its chunks are done, so the pool
 * holds no work between calls. IdentityService owns the clustering pool and
 * RebuildCoordinator owns the build pool. submit() and parallel_for() are
 * thread-safe.
 */

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace visage::core {

/** \brief Worker pool; joins its threads on destruction after draining the queue. */
class ThreadPool {
public:
    /** \brief Construct pool with the given number of workers.
     *
     * \param num_threads Number of worker threads (0 = hardware concurrency / 2)
     */
    explicit ThreadPool(std::size_t num_threads = 0)
        : stop_(false) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency() / 2);
        }
        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /** \brief Submit task to the pool.
     *
     * \return Future for task result; exceptions thrown by the task surface on get()
     * \throws std::runtime_error if the pool is stopping
     */
    template<typename Func, typename... Args>
    auto submit(Func&& func, Args&&... args)
        -> std::future<std::invoke_result_t<Func, Args...>> {
        using return_type = std::invoke_result_t<Func, Args...>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<Func>(func), std::forward<Args>(args)...)
        );
        auto future = task->get_future();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("Thread pool is stopped");
            }
            tasks_.emplace_back([task] { (*task)(); });
        }

        cv_.notify_one();
        return future;
    }

    /** \brief Execute func(i) for i in [start, end) in chunks, blocking until done.
     *
     * \param chunk_size Size of chunks to process (0 = auto)
     */
    template<typename Func>
    auto parallel_for(std::size_t start, std::size_t end,
                      Func&& func, std::size_t chunk_size = 0) -> void {
        if (start >= end) return;
        if (chunk_size == 0) {
            chunk_size = std::max<std::size_t>(1, (end - start) / (workers_.size() * 4));
        }

        std::vector<std::future<void>> futures;
        futures.reserve((end - start) / chunk_size + 1);
        for (std::size_t i = start; i < end; i += chunk_size) {
            const auto chunk_end = std::min(i + chunk_size, end);
            futures.push_back(submit([i, chunk_end, &func] {
                for (std::size_t j = i; j < chunk_end; ++j) {
                    func(j);
                }
            }));
        }

        // Propagate the first exception after every chunk has finished.
        std::exception_ptr first;
        for (auto& future : futures) {
            try {
                future.get();
            } catch (...) {
                if (!first) first = std::current_exception();
            }
        }
        if (first) std::rethrow_exception(first);
    }

    [[nodiscard]] auto num_threads() const noexcept -> std::size_t {
        return workers_.size();
    }

private:
    auto worker_loop() -> void {
#if defined(__linux__)
        pthread_setname_np(pthread_self(), "visage-worker");
#endif
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

                if (stop_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_;
};

} // namespace visage::core
