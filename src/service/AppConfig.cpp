#include "service/AppConfig.hpp"

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace IpSift
{
namespace Service
{
    namespace
    {
        void readInt(const Utils::ConfigLoader &loader, const char *key,
                     std::int64_t &target, std::vector<std::string> *problems)
        {
            const auto raw = loader.getString(key);
            if (!raw)
            {
                return;
            }
            const auto value = Utils::parseInteger<std::int64_t>(*raw);
            if (!value)
            {
                if (problems)
                {
                    problems->push_back(std::string(key) + " is not a whole number: '" + *raw + "'");
                }
                return;
            }
            target = *value;
        }
    } // anonymous namespace

    AppConfig AppConfig::fromLoader(const Utils::ConfigLoader &loader,
                                    std::vector<std::string> *problems)
    {
        AppConfig cfg;

        cfg.filePath              = loader.getStringOr(ConfigKeys::FilePath, cfg.filePath);
        cfg.databaseName          = loader.getStringOr(ConfigKeys::DatabaseName, cfg.databaseName);
        cfg.privateCollectionName = loader.getStringOr(ConfigKeys::PrivateCollectionName, cfg.privateCollectionName);
        cfg.publicCollectionName  = loader.getStringOr(ConfigKeys::PublicCollectionName, cfg.publicCollectionName);
        cfg.storeConnectionURI    = loader.getStringOr(ConfigKeys::StoreConnectionURI, cfg.storeConnectionURI);
        cfg.logLevel              = loader.getStringOr(ConfigKeys::LogLevel, cfg.logLevel);
        cfg.logFile               = loader.getStringOr(ConfigKeys::LogFile, cfg.logFile);

        readInt(loader, ConfigKeys::ChunkSizeBytes, cfg.chunkSizeBytes, problems);
        readInt(loader, ConfigKeys::WorkerCount, cfg.workerCount, problems);
        readInt(loader, ConfigKeys::RunIntervalSeconds, cfg.runIntervalSeconds, problems);

        return cfg;
    }

    std::vector<std::string> AppConfig::validate() const
    {
        std::vector<std::string> problems;

        if (filePath.empty())
            problems.emplace_back("filePath must not be empty");
        if (chunkSizeBytes <= 0)
            problems.emplace_back("chunkSizeBytes must be positive");
        if (workerCount < 0)
            problems.emplace_back("workerCount must not be negative");
        if (runIntervalSeconds <= 0)
            problems.emplace_back("runIntervalSeconds must be positive");
        else if (runIntervalSeconds > kMaxRunIntervalSeconds)
            problems.emplace_back("runIntervalSeconds must not exceed " +
                                  std::to_string(kMaxRunIntervalSeconds));
        if (storeConnectionURI.empty())
            problems.emplace_back("storeConnectionURI must not be empty");
        if (!Utils::isIdentifier(databaseName))
            problems.emplace_back("databaseName must match [A-Za-z0-9_]+");
        if (!Utils::isIdentifier(privateCollectionName))
            problems.emplace_back("privateCollectionName must match [A-Za-z0-9_]+");
        if (!Utils::isIdentifier(publicCollectionName))
            problems.emplace_back("publicCollectionName must match [A-Za-z0-9_]+");
        if (privateCollectionName == publicCollectionName)
            problems.emplace_back("private and public collections must differ");
        if (!Utils::parseLogLevel(logLevel))
            problems.emplace_back("logLevel must be one of TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL");

        return problems;
    }

    const std::vector<std::pair<std::string, std::string>> &AppConfig::environmentOverrides()
    {
        static const std::vector<std::pair<std::string, std::string>> mapping = {
            {ConfigKeys::FilePath,              "IPSIFT_FILE_PATH"},
            {ConfigKeys::StoreConnectionURI,    "IPSIFT_STORE_URI"},
            {ConfigKeys::DatabaseName,          "IPSIFT_DATABASE_NAME"},
            {ConfigKeys::PrivateCollectionName, "IPSIFT_PRIVATE_COLLECTION"},
            {ConfigKeys::PublicCollectionName,  "IPSIFT_PUBLIC_COLLECTION"},
            {ConfigKeys::RunIntervalSeconds,    "IPSIFT_RUN_INTERVAL"},
        };
        return mapping;
    }

} // namespace Service
} // namespace IpSift
