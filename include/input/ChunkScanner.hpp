#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>

#include "analysis/AddressClassifier.hpp"

namespace IpSift
{
    namespace Input
    {
        /// Per-chunk outcome handed from a worker back to the merging thread.
        struct ChunkResult
        {
            std::unordered_set<std::string> privateAddresses;
            std::unordered_set<std::string> publicAddresses;
            std::size_t candidates = 0;   // distinct matches in this chunk
            std::size_t excluded   = 0;   // of those, classified Invalid
        };

        /**
         * ChunkScanner
         *
         * Finds IPv4 literals in a raw byte buffer.
         *
         * The pattern restricts every group to 0-255 at the character level
         * (25[0-5] | 2[0-4]d | [01]?dd?) and anchors both ends on word
         * boundaries, so "1.2.3.4" inside "v1.2.3.4" or "1.2.3.45678" is not
         * reported. Bytes outside ASCII never take part in a match, so
         * non-text content is skipped rather than failing the chunk.
         *
         * Addresses split across two chunks are not reassembled.
         *
         * The compiled pattern is immutable after construction; scan() keeps
         * its iteration state on the stack and is safe to call concurrently.
         */
        class ChunkScanner
        {
        public:
            ChunkScanner();

            ChunkScanner(const ChunkScanner &)            = delete;
            ChunkScanner &operator=(const ChunkScanner &) = delete;

            /// Distinct IPv4 literals found in the chunk.
            std::unordered_set<std::string> scan(std::string_view chunk) const;

            /// scan() followed by classification of every distinct candidate.
            ChunkResult process(std::string_view chunk,
                                const Analysis::AddressClassifier &classifier) const;

            /// Source text of the compiled pattern (for diagnostics).
            static const char *pattern() noexcept;

        private:
            std::regex m_pattern;
        };

    } // namespace Input
} // namespace IpSift
