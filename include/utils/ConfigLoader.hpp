#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>
#include <utility>
#include <vector>
#include <mutex>

namespace IpSift
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Responsibilities:
         *  - Load a simple text configuration file (key = value format).
         *  - Apply environment variable overrides on top of the file.
         *  - Provide typed getters with defaults.
         *
         * Format:
         *  - Each line is: key = value
         *  - Lines starting with '#' or ';' are comments.
         *  - Empty lines are ignored.
         *  - Whitespace around key and value is trimmed.
         *
         * Example:
         *   filePath           = data/access.log
         *   chunkSizeBytes     = 1048576
         *   runIntervalSeconds = 10
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            ~ConfigLoader() = default;

            /**
             * Load configuration from a file path.
             *
             * Returns true on success, false if the file cannot be opened
             * (existing values are kept). Malformed lines are skipped.
             */
            bool loadFromFile(const std::string &filePath);

            /// Same parser as loadFromFile, over in-memory text.
            void loadFromString(std::string_view text);

            /**
             * Override keys from environment variables.
             *
             * Each pair is (config key, variable name); a variable that is
             * set and non-empty replaces the key's value. Returns the number
             * of keys overridden.
             */
            std::size_t applyEnvironment(
                const std::vector<std::pair<std::string, std::string>> &mapping);

            /// Manually set a configuration key-value pair (CLI overrides, tests).
            void set(std::string key, std::string value);

            bool hasKey(std::string_view key) const;

            /// Raw string value for a key; std::nullopt if missing.
            std::optional<std::string> getString(std::string_view key) const;

            std::string getStringOr(std::string_view key,
                                    std::string_view defaultValue) const;

            /// Integer value; std::nullopt if missing or not a whole number.
            std::optional<std::int64_t> getInt(std::string_view key) const;

            std::int64_t getIntOr(std::string_view key, std::int64_t defaultValue) const;

        private:
            static std::unordered_map<std::string, std::string> parse(std::istream &in);

            std::optional<std::string> getRawUnlocked(std::string_view key) const;

        private:
            std::unordered_map<std::string, std::string> m_values;

            mutable std::mutex m_mutex;
        };

    } // namespace Utils
} // namespace IpSift
