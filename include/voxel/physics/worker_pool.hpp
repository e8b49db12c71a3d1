/// @file worker_pool.hpp
/// @brief Fixed-size thread pool with a blocking parallel-for

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace voxel_physics {

/// Thread pool used by the solver and integrator.
///
/// parallel_for() splits a range into contiguous chunks, runs chunk 0 on the
/// calling thread and the rest on workers, and returns only when every chunk
/// has finished. The first exception thrown by any chunk is rethrown on the
/// caller after that barrier. With zero workers everything runs inline.
class WorkerPool {
public:
    using Task = std::function<void()>;
    /// (chunk_index, begin, end)
    using RangeFn = std::function<void(std::size_t, std::size_t, std::size_t)>;

    /// Create pool with `num_threads` workers besides the caller
    explicit WorkerPool(std::size_t num_threads);

    /// Waits for queued tasks, then joins workers
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Workers for a configured count; 0 means hardware_concurrency - 1
    [[nodiscard]] static std::size_t resolve_thread_count(std::size_t requested);

    /// Submit a fire-and-forget task
    void submit(Task task);

    /// Submit a task and get a future for the result
    template<typename F, typename R = std::invoke_result_t<F>>
    [[nodiscard]] std::future<R> submit_with_result(F&& func) {
        auto promise = std::make_shared<std::promise<R>>();
        auto future = promise->get_future();

        submit([promise, func = std::forward<F>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<R>) {
                    func();
                    promise->set_value();
                } else {
                    promise->set_value(func());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });

        return future;
    }

    /// Block until the queue is drained and no task is running
    void wait_all();

    /// Run `func` over [0, count) in chunks of at least `min_chunk` items
    void parallel_for(std::size_t count, std::size_t min_chunk, const RangeFn& func);

    /// Number of chunks parallel_for would use for this range
    [[nodiscard]] std::size_t chunk_count(std::size_t count, std::size_t min_chunk) const noexcept;

    [[nodiscard]] std::size_t thread_count() const noexcept { return m_threads.size(); }
    [[nodiscard]] std::size_t pending_count() const;

private:
    void worker_thread();

    std::vector<std::thread> m_threads;
    std::deque<Task> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_done_condition;
    bool m_stop = false;
    std::size_t m_pending = 0;
};

} // namespace voxel_physics
