#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <string_view>
#include <cstdint>

namespace IpSift
{
    namespace Utils
    {
        /**
         * Time utilities for log timestamps and run timing.
         *
         * Notes:
         *  - system_clock is used for wall-clock timestamps in log lines.
         *  - steady_clock is used for elapsed-time measurements, so run
         *    durations are unaffected by clock adjustments.
         */

        using Clock        = std::chrono::system_clock;
        using TimePoint    = std::chrono::time_point<Clock>;
        using SteadyClock  = std::chrono::steady_clock;
        using milliseconds = std::chrono::milliseconds;
        using seconds      = std::chrono::seconds;

        /// Convert a TimePoint to time_t (second precision).
        std::time_t to_time_t(TimePoint tp) noexcept;

        /// Current wall-clock time.
        TimePoint now() noexcept;

        /**
         * Format a TimePoint into a human-readable local timestamp string.
         *
         * Default format: "YYYY-MM-DD HH:MM:SS"
         */
        std::string formatTimestamp(TimePoint tp,
                                    std::string_view format = "%Y-%m-%d %H:%M:%S");

        /// Milliseconds elapsed on the steady clock since start.
        std::int64_t elapsedMillis(SteadyClock::time_point start) noexcept;

    } // namespace Utils
} // namespace IpSift
