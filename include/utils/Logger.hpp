#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>

#include "utils/TimeUtils.hpp"  // for TimePoint and formatting

namespace IpSift
{
    namespace Utils
    {
        /**
         * Log severity levels used across the system.
         *
         * Typical usage:
         *  - TRACE: per-chunk internals
         *  - DEBUG: pipeline sizing, store statements
         *  - INFO: cycle start, counts found, sleeps
         *  - WARN: configuration fallbacks
         *  - ERROR: failed runs (input, processing, store)
         *  - CRITICAL: startup failures
         */
        enum class LogLevel
        {
            TRACE    = 0,
            DEBUG    = 1,
            INFO     = 2,
            WARN     = 3,
            ERROR    = 4,
            CRITICAL = 5,
        };

        /// Parse "info", "WARN", ... (case-insensitive); std::nullopt if unknown.
        std::optional<LogLevel> parseLogLevel(std::string_view text);

        /**
         * Logger
         *
         * Thread-safe logging facility shared by the scheduler, the
         * extraction pipeline and the result store.
         *
         * Features:
         *  - Global log level filtering.
         *  - Optional append-mode log file in addition to stderr.
         *  - Timestamps on every message.
         *
         * Non-copyable and non-movable; the process-wide instance is
         * obtained through getLogger().
         */
        class Logger
        {
        public:
            /// Create a logger that writes to stderr only.
            Logger();

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            ~Logger();

            /// Set the minimum severity that will be logged.
            void setLevel(LogLevel level) noexcept;

            /// Get the currently configured minimum severity.
            LogLevel level() const noexcept;

            /// Check quickly whether this level would be logged.
            bool isEnabled(LogLevel level) const noexcept;

            /**
             * Start (or switch) file output. An empty path disables the file
             * sink. Returns false if the file cannot be opened; console output
             * is unaffected either way.
             */
            bool setFile(std::string_view filePath);

            /// Redirect console output (tests capture into a std::ostringstream).
            void setConsole(std::ostream *console) noexcept;

            /**
             * Log a message with a given severity.
             *
             * The entry is formatted as "[timestamp] [LEVEL] message" and
             * written to every active sink under one lock.
             */
            void log(LogLevel level, std::string_view message);

            void trace(std::string_view message)   { log(LogLevel::TRACE, message); }
            void debug(std::string_view message)   { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)    { log(LogLevel::INFO,  message); }
            void warn(std::string_view message)    { log(LogLevel::WARN,  message); }
            void error(std::string_view message)   { log(LogLevel::ERROR, message); }
            void critical(std::string_view message){ log(LogLevel::CRITICAL, message); }

            /// Level name as printed in log lines, e.g. "INFO".
            static const char *toString(LogLevel level) noexcept;

        private:
            /// Write a fully formatted line to the active sinks.
            void writeLine(std::string_view line);

        private:
            LogLevel                        m_level;
            std::ofstream                   m_file;       // RAII-managed file handle
            bool                            m_fileEnabled;
            std::ostream                   *m_console;    // usually &std::cerr
            mutable std::mutex              m_mutex;      // protects all writes
        };

        /**
         * Global logger accessor.
         *
         * Lazily created, stderr only, INFO level until main() applies
         * the configured level and log file.
         *
         *   Logger &log = getLogger();
         *   log.info("Calling extraction cycle");
         */
        Logger &getLogger();

    } // namespace Utils
} // namespace IpSift
