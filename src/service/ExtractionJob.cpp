#include "service/ExtractionJob.hpp"

#include <stdexcept>
#include <utility>

#include "utils/Logger.hpp"

namespace IpSift
{
namespace Service
{
    ExtractionJob::ExtractionJob(const Pipeline::ExtractionPipeline &pipeline,
                                 StoreFactory storeFactory,
                                 JobSettings settings)
        : m_pipeline(pipeline),
          m_storeFactory(std::move(storeFactory)),
          m_settings(std::move(settings))
    {
        if (!m_storeFactory)
        {
            throw std::invalid_argument("ExtractionJob needs a store factory");
        }
    }

    bool ExtractionJob::runOnce()
    {
        auto &logger = Utils::getLogger();

        std::unique_ptr<Store::ResultStore> store = m_storeFactory();
        if (!store)
        {
            throw std::runtime_error("store factory returned no store");
        }

        try
        {
            store->connect();
        }
        catch (const Store::StoreError &e)
        {
            logger.error(std::string("Failed to connect to store: ") + e.what());
            return false;
        }

        core::ExtractionResult result = m_pipeline.extract(m_settings.filePath);

        // An empty result still replaces the previous one.
        store->replaceCollection(m_settings.privateCollection, result.privateAddresses);
        store->replaceCollection(m_settings.publicCollection, result.publicAddresses);

        logger.info("Private IPs: " + std::to_string(result.privateAddresses.size()));
        logger.info("Public IPs: " + std::to_string(result.publicAddresses.size()));

        store->close();
        m_lastResult = std::move(result);
        return true;
    }

} // namespace Service
} // namespace IpSift
