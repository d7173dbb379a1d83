#include "pipeline/WorkerPool.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "utils/Logger.hpp"

namespace IpSift
{
namespace Pipeline
{
    std::size_t WorkerPool::defaultThreadCount() noexcept
    {
        const unsigned hw = std::thread::hardware_concurrency();
        return hw > 0 ? static_cast<std::size_t>(hw) : 4;
    }

    WorkerPool::WorkerPool(std::size_t threadCount)
        : m_threadCount(threadCount > 0 ? threadCount : defaultThreadCount())
    {
        m_threads.reserve(m_threadCount);
        for (std::size_t i = 0; i < m_threadCount; ++i)
        {
            m_threads.emplace_back(&WorkerPool::workerLoop, this);
        }
        Utils::getLogger().trace("WorkerPool started with " + std::to_string(m_threadCount) + " threads");
    }

    WorkerPool::~WorkerPool()
    {
        shutdown();
    }

    void WorkerPool::submit(std::function<void()> task)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping)
            {
                throw std::runtime_error("submit on a stopped worker pool");
            }
            m_tasks.push_back(std::move(task));
        }
        m_cv.notify_one();
    }

    std::size_t WorkerPool::pending() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tasks.size();
    }

    void WorkerPool::shutdown() noexcept
    {
        std::size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping && m_threads.empty())
            {
                return;
            }
            m_stopping = true;
            dropped = m_tasks.size();
            m_tasks.clear();
        }
        m_cv.notify_all();

        for (auto &t : m_threads)
        {
            if (t.joinable())
            {
                t.join();
            }
        }
        m_threads.clear();

        if (dropped > 0)
        {
            Utils::getLogger().debug("WorkerPool dropped " + std::to_string(dropped) + " pending tasks");
        }
    }

    void WorkerPool::workerLoop()
    {
        for (;;)
        {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });
                if (m_tasks.empty())
                {
                    return; // stopping and nothing left
                }
                task = std::move(m_tasks.front());
                m_tasks.pop_front();
            }

            // Tasks report their own failures; anything escaping is a bug in
            // the task wrapper and must not take the thread down.
            try
            {
                task();
            }
            catch (const std::exception &e)
            {
                Utils::getLogger().error(std::string("Worker task failed: ") + e.what());
            }
            catch (...)
            {
                Utils::getLogger().error("Worker task failed with an unknown exception");
            }
        }
    }

} // namespace Pipeline
} // namespace IpSift
