#include "utils/ConfigLoader.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "utils/StringUtils.hpp"

namespace IpSift
{
    namespace Utils
    {
        std::unordered_map<std::string, std::string> ConfigLoader::parse(std::istream &in)
        {
            std::unordered_map<std::string, std::string> values;

            std::string line;
            while (std::getline(in, line))
            {
                const std::string_view trimmed = trim(line);
                if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';')
                {
                    continue;
                }

                const auto pos = trimmed.find('=');
                if (pos == std::string_view::npos)
                {
                    continue;
                }

                const std::string_view key   = trim(trimmed.substr(0, pos));
                const std::string_view value = trim(trimmed.substr(pos + 1));
                if (key.empty())
                {
                    continue;
                }

                // Last occurrence wins if key is repeated.
                values[std::string(key)] = std::string(value);
            }

            return values;
        }

        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in.is_open())
            {
                return false;
            }

            auto newValues = parse(in);

            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto &kv : newValues)
            {
                m_values[kv.first] = std::move(kv.second);
            }
            return true;
        }

        void ConfigLoader::loadFromString(std::string_view text)
        {
            std::istringstream in{std::string(text)};
            auto newValues = parse(in);

            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto &kv : newValues)
            {
                m_values[kv.first] = std::move(kv.second);
            }
        }

        std::size_t ConfigLoader::applyEnvironment(
            const std::vector<std::pair<std::string, std::string>> &mapping)
        {
            std::size_t applied = 0;
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto &entry : mapping)
            {
                const char *value = std::getenv(entry.second.c_str());
                if (value == nullptr || *value == '\0')
                {
                    continue;
                }
                m_values[entry.first] = std::string(trim(value));
                ++applied;
            }
            return applied;
        }

        void ConfigLoader::set(std::string key, std::string value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values[std::move(key)] = std::move(value);
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.find(std::string(key)) != m_values.end();
        }

        std::optional<std::string> ConfigLoader::getRawUnlocked(std::string_view key) const
        {
            auto it = m_values.find(std::string(key));
            if (it == m_values.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return getRawUnlocked(key);
        }

        std::string ConfigLoader::getStringOr(std::string_view key,
                                              std::string_view defaultValue) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto v = getRawUnlocked(key);
            if (!v)
            {
                return std::string(defaultValue);
            }
            return *v;
        }

        std::optional<std::int64_t> ConfigLoader::getInt(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto v = getRawUnlocked(key);
            if (!v)
            {
                return std::nullopt;
            }
            return parseInteger<std::int64_t>(*v);
        }

        std::int64_t ConfigLoader::getIntOr(std::string_view key, std::int64_t defaultValue) const
        {
            auto v = getInt(key);
            return v ? *v : defaultValue;
        }

    } // namespace Utils
} // namespace IpSift
