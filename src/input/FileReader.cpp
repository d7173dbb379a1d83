#include "input/FileReader.hpp"

#include <stdexcept>
#include <utility>

namespace IpSift
{
    namespace Input
    {
        FileReader::FileReader(const std::string &filePath)
        {
            open(filePath);
        }

        FileReader::FileReader(FileReader &&other) noexcept
            : m_stream(std::move(other.m_stream)),
              m_filePath(std::move(other.m_filePath)),
              m_bytesRead(other.m_bytesRead)
        {
            other.m_bytesRead = 0;
        }

        FileReader &FileReader::operator=(FileReader &&other) noexcept
        {
            if (this != &other)
            {
                close();
                m_stream    = std::move(other.m_stream);
                m_filePath  = std::move(other.m_filePath);
                m_bytesRead = other.m_bytesRead;
                other.m_bytesRead = 0;
            }
            return *this;
        }

        FileReader::~FileReader()
        {
            close();
        }

        bool FileReader::open(const std::string &filePath)
        {
            close();

            m_stream.clear();
            m_stream.open(filePath, std::ios::in | std::ios::binary);
            if (!m_stream.is_open())
            {
                return false;
            }

            m_filePath = filePath;
            return true;
        }

        void FileReader::close() noexcept
        {
            if (m_stream.is_open())
            {
                m_stream.close();
            }
            m_filePath.clear();
            m_bytesRead = 0;
        }

        bool FileReader::isOpen() const noexcept
        {
            return m_stream.is_open();
        }

        std::optional<std::string> FileReader::nextChunk(std::size_t maxBytes)
        {
            if (!m_stream.is_open())
            {
                throw std::runtime_error("read from a file that is not open");
            }
            if (maxBytes == 0)
            {
                throw std::runtime_error("chunk size must be positive");
            }

            std::string chunk(maxBytes, '\0');
            m_stream.read(&chunk[0], static_cast<std::streamsize>(maxBytes));
            const auto got = static_cast<std::size_t>(m_stream.gcount());

            if (m_stream.bad() || (m_stream.fail() && !m_stream.eof()))
            {
                throw std::runtime_error("read error in " + m_filePath);
            }
            if (got == 0)
            {
                return std::nullopt;
            }

            chunk.resize(got);
            m_bytesRead += got;
            return chunk;
        }

    } // namespace Input
} // namespace IpSift
