/// @file worker_pool.cpp
/// @brief WorkerPool implementation

#include <voxel/physics/worker_pool.hpp>

#include <voxel/core/log.hpp>

#include <algorithm>

namespace voxel_physics {

namespace {

/// Completion barrier for one parallel_for call
struct RangeBarrier {
    std::mutex mutex;
    std::condition_variable done;
    std::size_t remaining = 0;
    std::exception_ptr error;

    void finish(std::exception_ptr ex) {
        std::lock_guard lock(mutex);
        if (ex && !error) {
            error = ex;
        }
        if (--remaining == 0) {
            done.notify_all();
        }
    }

    void wait() {
        std::unique_lock lock(mutex);
        done.wait(lock, [this] { return remaining == 0; });
    }
};

} // anonymous namespace

WorkerPool::WorkerPool(std::size_t num_threads) {
    m_threads.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        m_threads.emplace_back(&WorkerPool::worker_thread, this);
    }
    voxel_core::physics_logger()->debug("Worker pool started with {} threads", num_threads);
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard lock(m_mutex);
        m_stop = true;
    }
    m_condition.notify_all();

    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

std::size_t WorkerPool::resolve_thread_count(std::size_t requested) {
    if (requested != 0) {
        return requested;
    }
    const std::size_t hw = std::thread::hardware_concurrency();
    return hw > 1 ? hw - 1 : 0;
}

void WorkerPool::submit(Task task) {
    if (m_threads.empty()) {
        task();
        return;
    }
    {
        std::lock_guard lock(m_mutex);
        m_tasks.push_back(std::move(task));
        ++m_pending;
    }
    m_condition.notify_one();
}

std::size_t WorkerPool::pending_count() const {
    std::lock_guard lock(m_mutex);
    return m_pending;
}

void WorkerPool::wait_all() {
    std::unique_lock lock(m_mutex);
    m_done_condition.wait(lock, [this] {
        return m_pending == 0;
    });
}

std::size_t WorkerPool::chunk_count(std::size_t count, std::size_t min_chunk) const noexcept {
    if (count == 0) {
        return 0;
    }
    const std::size_t grain = std::max<std::size_t>(1, min_chunk);
    const std::size_t by_size = (count + grain - 1) / grain;
    return std::min(by_size, m_threads.size() + 1);
}

void WorkerPool::parallel_for(std::size_t count, std::size_t min_chunk, const RangeFn& func) {
    const std::size_t chunks = chunk_count(count, min_chunk);
    if (chunks == 0) {
        return;
    }
    if (chunks == 1) {
        func(0, 0, count);
        return;
    }

    auto bounds = [count, chunks](std::size_t chunk) {
        return count * chunk / chunks;
    };

    RangeBarrier barrier;
    barrier.remaining = chunks;

    for (std::size_t chunk = 1; chunk < chunks; ++chunk) {
        submit([&barrier, &func, &bounds, chunk] {
            std::exception_ptr ex;
            try {
                func(chunk, bounds(chunk), bounds(chunk + 1));
            } catch (...) {
                ex = std::current_exception();
            }
            barrier.finish(ex);
        });
    }

    std::exception_ptr local;
    try {
        func(0, 0, bounds(1));
    } catch (...) {
        local = std::current_exception();
    }
    barrier.finish(local);
    barrier.wait();

    if (barrier.error) {
        std::rethrow_exception(barrier.error);
    }
}

void WorkerPool::worker_thread() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(m_mutex);
            m_condition.wait(lock, [this] {
                return m_stop || !m_tasks.empty();
            });

            if (m_stop && m_tasks.empty()) {
                return;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            voxel_core::physics_logger()->error("Worker task failed: {}", e.what());
        }

        {
            std::lock_guard lock(m_mutex);
            --m_pending;
        }
        m_done_condition.notify_all();
    }
}

} // namespace voxel_physics
