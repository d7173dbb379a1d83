#include "pipeline/ExtractionPipeline.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

#include "input/FileReader.hpp"
#include "pipeline/CompletionQueue.hpp"
#include "pipeline/WorkerPool.hpp"
#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

namespace IpSift
{
namespace Pipeline
{
    namespace
    {
        std::vector<std::string> toSortedList(std::unordered_set<std::string> &set)
        {
            std::vector<std::string> out;
            out.reserve(set.size());
            for (auto it = set.begin(); it != set.end();)
            {
                out.push_back(std::move(set.extract(it++).value()));
            }
            std::sort(out.begin(), out.end());
            return out;
        }

        bool isNonEmptyRegularFile(const std::string &filePath)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(filePath, ec) || ec)
            {
                return false;
            }
            const auto size = std::filesystem::file_size(filePath, ec);
            return !ec && size > 0;
        }
    } // anonymous namespace

    ExtractionPipeline::ExtractionPipeline(Analysis::AddressClassifier classifier,
                                           PipelineOptions options)
        : m_classifier(std::move(classifier)),
          m_scanner(),
          m_options(options)
    {
        if (m_options.chunkSizeBytes == 0)
        {
            Utils::getLogger().warn("Chunk size 0 replaced by default of " +
                                    std::to_string(PipelineOptions::kDefaultChunkSize) + " bytes");
            m_options.chunkSizeBytes = PipelineOptions::kDefaultChunkSize;
        }
        if (m_options.workerCount == 0)
        {
            m_options.workerCount = WorkerPool::defaultThreadCount();
        }
        if (m_options.maxInFlightChunks == 0)
        {
            m_options.maxInFlightChunks = 2 * m_options.workerCount;
        }
    }

    core::ExtractionResult ExtractionPipeline::extract(const std::string &filePath) const
    {
        auto &logger = Utils::getLogger();

        if (!isNonEmptyRegularFile(filePath))
        {
            logger.error("Invalid file: " + filePath);
            return {};
        }

        try
        {
            return run(filePath);
        }
        catch (const std::exception &e)
        {
            logger.error(std::string("Processing error: ") + e.what());
            return {};
        }
    }

    core::ExtractionResult ExtractionPipeline::run(const std::string &filePath) const
    {
        auto &logger = Utils::getLogger();
        const auto started = Utils::SteadyClock::now();

        Input::FileReader reader(filePath);
        if (!reader.isOpen())
        {
            throw std::runtime_error("cannot open " + filePath);
        }

        core::RunStats stats;
        std::unordered_set<std::string> privateSet;
        std::unordered_set<std::string> publicSet;

        // Declared before the pool so it outlives every task that refers to it.
        CompletionQueue<Input::ChunkResult> completed;
        std::size_t inFlight = 0;

        auto mergeNext = [&]() {
            Input::ChunkResult chunk = completed.pop().get();
            --inFlight;
            stats.distinctCandidates += chunk.candidates;
            stats.excluded += chunk.excluded;
            privateSet.merge(chunk.privateAddresses);
            publicSet.merge(chunk.publicAddresses);
        };

        {
            WorkerPool pool(m_options.workerCount);

            while (auto chunk = reader.nextChunk(m_options.chunkSizeBytes))
            {
                while (inFlight >= m_options.maxInFlightChunks)
                {
                    mergeNext();
                }

                pool.submit(completed.wrap(
                    [this, data = std::move(*chunk)]() {
                        return m_scanner.process(data, m_classifier);
                    }));
                ++inFlight;
                ++stats.chunks;
            }

            while (inFlight > 0)
            {
                mergeNext();
            }
        }

        stats.bytesRead = reader.bytesRead();
        reader.close();

        core::ExtractionResult result;
        result.privateAddresses = toSortedList(privateSet);
        result.publicAddresses  = toSortedList(publicSet);
        stats.elapsedMs = Utils::elapsedMillis(started);
        result.stats = stats;

        if (logger.isEnabled(Utils::LogLevel::DEBUG))
            logger.debug("Scanned " + std::to_string(stats.chunks) + " chunks (" +
                         std::to_string(stats.bytesRead) + " bytes) of " + filePath + " in " +
                         std::to_string(stats.elapsedMs) + " ms; " +
                         std::to_string(stats.excluded) + " candidates excluded");
        return result;
    }

} // namespace Pipeline
} // namespace IpSift
