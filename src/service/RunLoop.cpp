#include "service/RunLoop.hpp"

#include <exception>
#include <string>

#include "utils/Logger.hpp"

namespace IpSift
{
namespace Service
{
    RunLoop::RunLoop(std::chrono::milliseconds interval)
        : m_interval(interval)
    {
    }

    std::size_t RunLoop::runForever(const Cycle &cycle)
    {
        std::size_t number = 0;
        while (!stopRequested())
        {
            runCycle(++number, cycle);
            if (!waitInterval())
            {
                break;
            }
        }
        Utils::getLogger().info("Run loop stopped after " + std::to_string(number) + " cycles");
        return number;
    }

    std::size_t RunLoop::runCycles(std::size_t maxCycles, const Cycle &cycle)
    {
        std::size_t failures = 0;
        for (std::size_t number = 1; number <= maxCycles && !stopRequested(); ++number)
        {
            if (!runCycle(number, cycle))
            {
                ++failures;
            }
            if (number < maxCycles && !waitInterval())
            {
                break;
            }
        }
        return failures;
    }

    bool RunLoop::runCycle(std::size_t number, const Cycle &cycle)
    {
        auto &logger = Utils::getLogger();
        logger.info("Starting extraction cycle " + std::to_string(number));

        try
        {
            cycle();
            return true;
        }
        catch (const std::exception &e)
        {
            logger.error(std::string("Execution error: ") + e.what());
        }
        catch (...)
        {
            logger.error("Execution error: unknown exception");
        }
        return false;
    }

    bool RunLoop::waitInterval()
    {
        const auto secs = std::chrono::duration_cast<std::chrono::seconds>(m_interval).count();
        Utils::getLogger().info("Sleeping for " + std::to_string(secs) + " seconds");

        std::unique_lock<std::mutex> lock(m_mutex);
        return !m_cv.wait_for(lock, m_interval, [this] { return m_stop; });
    }

    void RunLoop::requestStop() noexcept
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stop = true;
        }
        m_cv.notify_all();
    }

    bool RunLoop::stopRequested() const noexcept
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stop;
    }

    void runForever(std::chrono::seconds interval, const RunLoop::Cycle &cycle)
    {
        RunLoop loop(std::chrono::duration_cast<std::chrono::milliseconds>(interval));
        loop.runForever(cycle);
    }

} // namespace Service
} // namespace IpSift
