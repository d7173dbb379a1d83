#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "utils/ConfigLoader.hpp"

namespace IpSift
{
namespace Service
{
    /// Recognized configuration keys.
    namespace ConfigKeys
    {
        inline constexpr const char *FilePath              = "filePath";
        inline constexpr const char *ChunkSizeBytes        = "chunkSizeBytes";
        inline constexpr const char *WorkerCount           = "workerCount";
        inline constexpr const char *DatabaseName          = "databaseName";
        inline constexpr const char *PrivateCollectionName = "privateCollectionName";
        inline constexpr const char *PublicCollectionName  = "publicCollectionName";
        inline constexpr const char *StoreConnectionURI    = "storeConnectionURI";
        inline constexpr const char *RunIntervalSeconds    = "runIntervalSeconds";
        inline constexpr const char *LogLevel              = "logLevel";
        inline constexpr const char *LogFile               = "logFile";
    } // namespace ConfigKeys

    /**
     * AppConfig
     *
     * Typed view of the configuration, built once at startup and passed
     * by value to the components that need it.
     */
    struct AppConfig
    {
        /// Longest accepted pause between cycles (one week).
        static constexpr std::int64_t kMaxRunIntervalSeconds = 7 * 24 * 60 * 60;

        std::string   filePath              = "data/access.log";
        std::int64_t  chunkSizeBytes        = 1024 * 1024;
        std::int64_t  workerCount           = 0;
        std::string   databaseName          = "ip_extraction";
        std::string   privateCollectionName = "private_ips";
        std::string   publicCollectionName  = "public_ips";
        std::string   storeConnectionURI    = "ip_extraction.db";
        std::int64_t  runIntervalSeconds    = 10;
        std::string   logLevel              = "INFO";
        std::string   logFile;

        /**
         * Read every recognized key from the loader, keeping the default for
         * keys that are absent. A key that is present but not a whole number
         * where one is expected is reported through problems.
         */
        static AppConfig fromLoader(const Utils::ConfigLoader &loader,
                                    std::vector<std::string> *problems = nullptr);

        /// Empty when the configuration is usable; otherwise one message per problem.
        std::vector<std::string> validate() const;

        /// (config key, environment variable) pairs applied over the file.
        static const std::vector<std::pair<std::string, std::string>> &environmentOverrides();
    };

} // namespace Service
} // namespace IpSift
