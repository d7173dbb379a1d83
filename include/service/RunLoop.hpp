#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace IpSift
{
namespace Service
{
    /**
     * RunLoop
     *
     * Fixed-interval scheduler: run a cycle, wait the interval, repeat.
     * The wait starts after the cycle ends, whether it succeeded or failed,
     * and never grows. A throwing cycle is logged and the loop carries on.
     *
     * requestStop() may be called from any thread; it wakes a pending wait
     * and the loop returns after the current cycle.
     */
    class RunLoop
    {
    public:
        using Cycle = std::function<void()>;

        explicit RunLoop(std::chrono::milliseconds interval);

        RunLoop(const RunLoop &)            = delete;
        RunLoop &operator=(const RunLoop &) = delete;

        /// Loop until requestStop(). Returns the number of cycles run.
        std::size_t runForever(const Cycle &cycle);

        /**
         * Run at most maxCycles cycles (fewer if stopped), waiting the
         * interval between cycles but not after the last one.
         * Returns the number of cycles that threw.
         */
        std::size_t runCycles(std::size_t maxCycles, const Cycle &cycle);

        void requestStop() noexcept;
        bool stopRequested() const noexcept;

        std::chrono::milliseconds interval() const noexcept { return m_interval; }

    private:
        /// Run one cycle; false if it threw.
        bool runCycle(std::size_t number, const Cycle &cycle);

        /// Wait the interval; false if a stop was requested meanwhile.
        bool waitInterval();

    private:
        std::chrono::milliseconds m_interval;
        mutable std::mutex        m_mutex;
        std::condition_variable   m_cv;
        bool                      m_stop = false;
    };

    /// Build a RunLoop for interval and run cycle until the process is stopped.
    void runForever(std::chrono::seconds interval, const RunLoop::Cycle &cycle);

} // namespace Service
} // namespace IpSift
