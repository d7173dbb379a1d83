#pragma once

#include <functional>
#include <memory>
#include <string>

#include "core/ExtractionResult.hpp"
#include "pipeline/ExtractionPipeline.hpp"
#include "store/ResultStore.hpp"

namespace IpSift
{
namespace Service
{
    /// Builds a fresh, unconnected store for one cycle.
    using StoreFactory = std::function<std::unique_ptr<Store::ResultStore>()>;

    struct JobSettings
    {
        std::string filePath;
        std::string privateCollection = "private_ips";
        std::string publicCollection  = "public_ips";
    };

    /**
     * ExtractionJob
     *
     * One scheduled cycle: connect, extract, overwrite both collections,
     * report counts, disconnect.
     *
     * If the store cannot be reached the cycle stops before extraction and
     * nothing is written. Failures after connecting (a write error, say)
     * propagate to the caller; the store connection is closed either way.
     */
    class ExtractionJob
    {
    public:
        ExtractionJob(const Pipeline::ExtractionPipeline &pipeline,
                      StoreFactory storeFactory,
                      JobSettings settings);

        /// Returns false when the store was unreachable, true when the cycle completed.
        bool runOnce();

        /// Result of the last completed cycle.
        const core::ExtractionResult &lastResult() const noexcept { return m_lastResult; }

    private:
        const Pipeline::ExtractionPipeline &m_pipeline;
        StoreFactory                        m_storeFactory;
        JobSettings                         m_settings;
        core::ExtractionResult              m_lastResult;
    };

} // namespace Service
} // namespace IpSift
