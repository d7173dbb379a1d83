#pragma once

#include <cstddef>
#include <string>

#include "analysis/AddressClassifier.hpp"
#include "core/ExtractionResult.hpp"
#include "input/ChunkScanner.hpp"

namespace IpSift
{
namespace Pipeline
{
    struct PipelineOptions
    {
        static constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

        std::size_t chunkSizeBytes    = kDefaultChunkSize;
        std::size_t workerCount       = 0;  // 0: hardware concurrency
        std::size_t maxInFlightChunks = 0;  // 0: twice the worker count
    };

    /**
     * ExtractionPipeline
     *
     * Reads a file in fixed-size chunks, scans and classifies each chunk on
     * a worker pool, and unions the per-chunk sets as workers finish.
     *
     * Contract of extract():
     *  - the path must name an existing regular file with size > 0,
     *    otherwise "Invalid file" is logged and an empty result returned;
     *  - any read or worker failure aborts the run, is logged, and yields
     *    an empty result (never a partial one);
     *  - on success both lists are deduplicated and string-sorted.
     *
     * The file and the worker pool are released before extract() returns,
     * on every path. Only the merging thread touches the accumulators.
     */
    class ExtractionPipeline
    {
    public:
        explicit ExtractionPipeline(Analysis::AddressClassifier classifier,
                                    PipelineOptions options = PipelineOptions{});

        ExtractionPipeline(const ExtractionPipeline &)            = delete;
        ExtractionPipeline &operator=(const ExtractionPipeline &) = delete;

        core::ExtractionResult extract(const std::string &filePath) const;

        const PipelineOptions &options() const noexcept { return m_options; }

    private:
        core::ExtractionResult run(const std::string &filePath) const;

    private:
        Analysis::AddressClassifier m_classifier;
        Input::ChunkScanner         m_scanner;
        PipelineOptions             m_options;
    };

} // namespace Pipeline
} // namespace IpSift
