// Result of one full-file extraction run.

#ifndef CORE_EXTRACTION_RESULT_HPP
#define CORE_EXTRACTION_RESULT_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace IpSift
{
namespace core
{

/**
 * @brief Counters gathered while a run scans its chunks.
 *
 * distinctCandidates counts per-chunk distinct matches, so an address seen
 * in two chunks is counted twice here even though it is stored once.
 */
struct RunStats
{
    std::size_t   chunks             = 0;
    std::uint64_t bytesRead          = 0;
    std::size_t   distinctCandidates = 0;
    std::size_t   excluded           = 0;
    std::int64_t  elapsedMs          = 0;
};

/**
 * @brief The two address lists produced by one run.
 *
 * Both lists are sorted by plain string comparison ("100.0.0.1" before
 * "2.2.2.2") and hold each address once. A run either produces a full
 * result or an empty one; there is no partial result.
 */
struct ExtractionResult
{
    std::vector<std::string> privateAddresses;
    std::vector<std::string> publicAddresses;
    RunStats                 stats;

    bool empty() const noexcept
    {
        return privateAddresses.empty() && publicAddresses.empty();
    }

    std::size_t total() const noexcept
    {
        return privateAddresses.size() + publicAddresses.size();
    }
};

} // namespace core
} // namespace IpSift

#endif // CORE_EXTRACTION_RESULT_HPP
