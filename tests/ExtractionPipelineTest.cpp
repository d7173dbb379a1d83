#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "pipeline/ExtractionPipeline.hpp"
#include "TestSupport.hpp"

using IpSift::Analysis::AddressClassifier;
using IpSift::Pipeline::ExtractionPipeline;
using IpSift::Pipeline::PipelineOptions;
using IpSift::Testing::LogCapture;
using IpSift::Testing::TempDir;
using List = std::vector<std::string>;

namespace
{
    ExtractionPipeline makePipeline(std::size_t chunkSize, std::size_t workers = 2,
                                    std::size_t maxInFlight = 0)
    {
        PipelineOptions options;
        options.chunkSizeBytes = chunkSize;
        options.workerCount = workers;
        options.maxInFlightChunks = maxInFlight;
        return ExtractionPipeline(AddressClassifier::withDefaultRanges(), options);
    }

    // Every line padded to the same width so chunk sizes that are multiples
    // of it never cut an address.
    constexpr std::size_t kLineWidth = 32;

    std::string fixedWidthLog(const std::vector<std::string> &payloads)
    {
        std::string out;
        for (const auto &p : payloads)
        {
            std::string line = p;
            line.resize(kLineWidth - 1, ' ');
            line.push_back('\n');
            out += line;
        }
        return out;
    }
} // namespace

TEST(ExtractionPipelineTest, SingleLineExample)
{
    TempDir dir;
    const std::string line = "req from 10.0.0.5 and 8.8.8.8 and 10.0.0.5 failed";
    const auto path = dir.write("access.log", line);

    const auto result = makePipeline(PipelineOptions::kDefaultChunkSize).extract(path);

    EXPECT_EQ(result.privateAddresses, (List{"10.0.0.5"}));
    EXPECT_EQ(result.publicAddresses, (List{"8.8.8.8"}));
    EXPECT_EQ(result.stats.chunks, 1u);
    EXPECT_EQ(result.stats.bytesRead, line.size());
}

TEST(ExtractionPipelineTest, ListsAreStringSorted)
{
    TempDir dir;
    const auto path = dir.write("access.log",
                                "9.9.9.9 100.0.0.1 10.0.0.256_invalid_skip 2.2.2.2 "
                                "192.168.1.1 10.0.0.20 10.0.0.3 9.9.9.9");

    const auto result = makePipeline(PipelineOptions::kDefaultChunkSize).extract(path);

    EXPECT_EQ(result.publicAddresses, (List{"100.0.0.1", "2.2.2.2", "9.9.9.9"}));
    EXPECT_EQ(result.privateAddresses, (List{"10.0.0.20", "10.0.0.3", "192.168.1.1"}));
}

TEST(ExtractionPipelineTest, ChunkSizeDoesNotChangeResultWhenNoAddressIsCut)
{
    TempDir dir;
    std::vector<std::string> payloads;
    for (int i = 0; i < 40; ++i)
    {
        payloads.push_back("src 10.1." + std::to_string(i % 7) + ".9 ok");
        payloads.push_back("dst 172.20.0." + std::to_string(i) + " ok");
        payloads.push_back("ext 8.8." + std::to_string(i % 5) + ".8 get");
        payloads.push_back("mc 224.0.0." + std::to_string(i % 3 + 1));
    }
    const auto path = dir.write("access.log", fixedWidthLog(payloads));

    const auto whole = makePipeline(PipelineOptions::kDefaultChunkSize, 1).extract(path);
    ASSERT_FALSE(whole.empty());
    EXPECT_EQ(whole.privateAddresses.size(), 7u + 40u);
    EXPECT_EQ(whole.publicAddresses.size(), 5u);

    for (std::size_t chunk : {kLineWidth, 2 * kLineWidth, 7 * kLineWidth, 64 * kLineWidth})
    {
        for (std::size_t workers : {1u, 4u})
        {
            const auto r = makePipeline(chunk, workers).extract(path);
            EXPECT_EQ(r.privateAddresses, whole.privateAddresses) << chunk << "/" << workers;
            EXPECT_EQ(r.publicAddresses, whole.publicAddresses) << chunk << "/" << workers;
        }
    }
}

TEST(ExtractionPipelineTest, BoundedInFlightStillConsumesEveryChunk)
{
    TempDir dir;
    std::vector<std::string> payloads;
    for (int i = 0; i < 200; ++i)
    {
        payloads.push_back("hit 11.0." + std::to_string(i / 100) + "." + std::to_string(i % 100));
    }
    const auto path = dir.write("access.log", fixedWidthLog(payloads));

    const auto result = makePipeline(kLineWidth, 3, 1).extract(path);

    EXPECT_EQ(result.stats.chunks, 200u);
    EXPECT_EQ(result.publicAddresses.size(), 200u);
    EXPECT_TRUE(result.privateAddresses.empty());
}

TEST(ExtractionPipelineTest, PartitionIsDisjointAndAccountsForExclusions)
{
    TempDir dir;
    const auto path = dir.write("access.log",
                                "0.0.0.0 10.0.0.1 8.8.8.8 224.0.0.1 240.1.1.1 127.0.0.1 "
                                "172.16.3.3 1.1.1.1 10.0.0.1");

    const auto result = makePipeline(PipelineOptions::kDefaultChunkSize).extract(path);

    for (const auto &ip : result.privateAddresses)
    {
        EXPECT_FALSE(std::binary_search(result.publicAddresses.begin(),
                                        result.publicAddresses.end(), ip)) << ip;
    }
    EXPECT_EQ(result.stats.excluded, 3u);
    EXPECT_EQ(result.stats.distinctCandidates, result.total() + result.stats.excluded);
    EXPECT_EQ(result.privateAddresses, (List{"10.0.0.1", "172.16.3.3"}));
    EXPECT_EQ(result.publicAddresses, (List{"1.1.1.1", "127.0.0.1", "8.8.8.8"}));
}

TEST(ExtractionPipelineTest, AddressCutByChunkBoundaryIsLost)
{
    TempDir dir;
    // "x 192.16" | "8.1.10 y"
    const auto path = dir.write("access.log", "x 192.168.1.10 y");

    const auto result = makePipeline(8).extract(path);

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(result.stats.chunks, 2u);
}

TEST(ExtractionPipelineTest, EmptyFileYieldsEmptyResultAndError)
{
    TempDir dir;
    const auto path = dir.write("empty.log", "");
    LogCapture log;

    const auto result = makePipeline(PipelineOptions::kDefaultChunkSize).extract(path);

    EXPECT_TRUE(result.empty());
    EXPECT_TRUE(log.contains("[ERROR] Invalid file: " + path));
}

TEST(ExtractionPipelineTest, MissingPathAndDirectoryYieldEmptyResult)
{
    TempDir dir;
    LogCapture log;
    const auto pipeline = makePipeline(PipelineOptions::kDefaultChunkSize);

    EXPECT_TRUE(pipeline.extract(dir.file("missing.log")).empty());
    EXPECT_TRUE(pipeline.extract(dir.path().string()).empty());
    EXPECT_TRUE(log.contains("Invalid file: " + dir.file("missing.log")));
}

TEST(ExtractionPipelineTest, ZeroOptionsFallBackToDefaults)
{
    LogCapture log;
    const auto pipeline = makePipeline(0, 0, 0);

    EXPECT_EQ(pipeline.options().chunkSizeBytes, PipelineOptions::kDefaultChunkSize);
    EXPECT_GE(pipeline.options().workerCount, 1u);
    EXPECT_EQ(pipeline.options().maxInFlightChunks, 2 * pipeline.options().workerCount);
    EXPECT_TRUE(log.contains("[WARN] Chunk size 0"));
}

TEST(ExtractionPipelineTest, ReadFailureAbortsRunWithEmptyResult)
{
    TempDir dir;
    const auto path = dir.write("access.log", "10.0.0.5 8.8.8.8\n");
    LogCapture log;

    // No buffer of this size can be allocated, so the first read throws.
    const auto failing = makePipeline(std::string().max_size());
    const auto aborted = failing.extract(path);

    EXPECT_TRUE(aborted.empty());
    EXPECT_EQ(aborted.stats.chunks, 0u);
    EXPECT_TRUE(log.contains("[ERROR] Processing error: "));

    // Each run owns its reader and pool, so a second failing run fails the same way.
    EXPECT_TRUE(failing.extract(path).empty());
    const std::string text = log.text();
    const auto first = text.find("Processing error: ");
    ASSERT_NE(first, std::string::npos);
    EXPECT_NE(text.find("Processing error: ", first + 1), std::string::npos);

    const auto healthy = makePipeline(PipelineOptions::kDefaultChunkSize).extract(path);
    EXPECT_EQ(healthy.privateAddresses, (List{"10.0.0.5"}));
    EXPECT_EQ(healthy.publicAddresses, (List{"8.8.8.8"}));
}

TEST(ExtractionPipelineTest, RunSummaryIsLoggedOnlyAtDebug)
{
    TempDir dir;
    const auto path = dir.write("access.log", "10.0.0.5\n");
    const auto pipeline = makePipeline(PipelineOptions::kDefaultChunkSize);

    {
        LogCapture quiet(IpSift::Utils::LogLevel::INFO);
        EXPECT_FALSE(IpSift::Utils::getLogger().isEnabled(IpSift::Utils::LogLevel::DEBUG));
        pipeline.extract(path);
        EXPECT_FALSE(quiet.contains("Scanned"));
    }
    {
        LogCapture verbose(IpSift::Utils::LogLevel::DEBUG);
        pipeline.extract(path);
        EXPECT_TRUE(verbose.contains("[DEBUG] Scanned 1 chunks (9 bytes)"));
    }
}
