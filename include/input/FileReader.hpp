#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <fstream>
#include <optional>

namespace IpSift
{
    namespace Input
    {
        /**
         * FileReader
         *
         * Responsibilities:
         *  - Read a log file sequentially in fixed-size binary chunks.
         *  - Manage the file handle via RAII.
         *
         * Design notes:
         *  - Opened in binary mode: chunk boundaries are byte offsets and no
         *    newline translation happens.
         *  - Single-threaded ownership; the pipeline reads on one thread and
         *    hands the chunks to workers.
         *  - Not copyable (owning a file handle), but movable.
         */
        class FileReader
        {
        public:
            FileReader() = default;

            /**
             * Construct and open a file immediately.
             * If open fails, isOpen() will return false.
             */
            explicit FileReader(const std::string &filePath);

            FileReader(const FileReader &)            = delete;
            FileReader &operator=(const FileReader &) = delete;

            FileReader(FileReader &&other) noexcept;
            FileReader &operator=(FileReader &&other) noexcept;

            ~FileReader();

            /**
             * Open a file for binary reading.
             * Returns true on success; any previously open file is closed first.
             */
            bool open(const std::string &filePath);

            void close() noexcept;

            bool isOpen() const noexcept;

            /// Path of the currently opened file (empty if none).
            const std::string &filePath() const noexcept { return m_filePath; }

            /// Bytes handed out by nextChunk() since open().
            std::uint64_t bytesRead() const noexcept { return m_bytesRead; }

            /**
             * Read up to maxBytes from the current position.
             *
             * Returns:
             *   - the bytes read (only the last chunk may be shorter than maxBytes);
             *   - std::nullopt once end of file is reached.
             *
             * Throws std::runtime_error if the file is not open, maxBytes is 0,
             * or the stream fails for a reason other than end of file.
             */
            std::optional<std::string> nextChunk(std::size_t maxBytes);

        private:
            std::ifstream m_stream;
            std::string   m_filePath;
            std::uint64_t m_bytesRead = 0;
        };

    } // namespace Input
} // namespace IpSift
