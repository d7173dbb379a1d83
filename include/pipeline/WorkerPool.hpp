#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace IpSift
{
namespace Pipeline
{
    /**
     * WorkerPool
     *
     * Fixed-size set of threads pulling tasks from a FIFO queue. Each
     * thread runs one task to completion before taking the next.
     *
     * Scoped resource: the destructor stops intake, drops queued tasks that
     * have not started, and joins every thread. Callers that need every
     * task to run wait for their results before the pool leaves scope.
     */
    class WorkerPool
    {
    public:
        /// threadCount == 0 picks defaultThreadCount().
        explicit WorkerPool(std::size_t threadCount = 0);

        WorkerPool(const WorkerPool &)            = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        ~WorkerPool();

        /// Queue a task. Throws std::runtime_error after shutdown().
        void submit(std::function<void()> task);

        /// Stop intake, drop pending tasks, join threads. Idempotent.
        void shutdown() noexcept;

        std::size_t size() const noexcept { return m_threadCount; }

        /// Pending (not yet started) tasks.
        std::size_t pending() const;

        /// std::thread::hardware_concurrency(), or 4 when it is unknown.
        static std::size_t defaultThreadCount() noexcept;

    private:
        void workerLoop();

    private:
        std::size_t                       m_threadCount;
        std::vector<std::thread>          m_threads;
        std::deque<std::function<void()>> m_tasks;
        mutable std::mutex                m_mutex;
        std::condition_variable           m_cv;
        bool                              m_stopping = false;
    };

} // namespace Pipeline
} // namespace IpSift
