#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "utils/Logger.hpp"

namespace IpSift
{
namespace Testing
{
    /// Unique scratch directory, removed with its contents on destruction.
    class TempDir
    {
    public:
        TempDir()
        {
            static std::atomic<unsigned> counter{0};
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            m_path = std::filesystem::temp_directory_path() /
                     ("ipsift-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
            std::filesystem::create_directories(m_path);
        }

        TempDir(const TempDir &)            = delete;
        TempDir &operator=(const TempDir &) = delete;

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
        }

        std::string file(const std::string &name) const { return (m_path / name).string(); }

        std::string write(const std::string &name, const std::string &content) const
        {
            const std::string path = file(name);
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            return path;
        }

        const std::filesystem::path &path() const noexcept { return m_path; }

    private:
        std::filesystem::path m_path;
    };

    /// Routes the global logger into a buffer for the lifetime of the object.
    class LogCapture
    {
    public:
        explicit LogCapture(Utils::LogLevel level = Utils::LogLevel::DEBUG)
            : m_previousLevel(Utils::getLogger().level())
        {
            Utils::getLogger().setConsole(&m_buffer);
            Utils::getLogger().setLevel(level);
        }

        LogCapture(const LogCapture &)            = delete;
        LogCapture &operator=(const LogCapture &) = delete;

        ~LogCapture()
        {
            Utils::getLogger().setConsole(&std::cerr);
            Utils::getLogger().setLevel(m_previousLevel);
        }

        std::string text() const { return m_buffer.str(); }

        bool contains(const std::string &needle) const
        {
            return m_buffer.str().find(needle) != std::string::npos;
        }

    private:
        std::ostringstream m_buffer;
        Utils::LogLevel    m_previousLevel;
    };

} // namespace Testing
} // namespace IpSift
