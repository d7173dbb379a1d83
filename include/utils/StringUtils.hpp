#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <type_traits>

namespace IpSift
{
    namespace Utils
    {
        /**
         * String utility helpers for configuration values and store documents.
         *
         * All functions are stateless and thread-safe, and take
         * std::string_view where possible to avoid unnecessary copies.
         */

        /// Trim whitespace (space, tab, CR, LF) from the left side of the string view.
        inline std::string_view ltrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.begin(),
                sv.end(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            return std::string_view(it, static_cast<std::size_t>(sv.end() - it));
        }

        /// Trim whitespace (space, tab, CR, LF) from the right side of the string view.
        inline std::string_view rtrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.rbegin(),
                sv.rend(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            if (it == sv.rend())
            {
                return std::string_view{};
            }
            return std::string_view(sv.data(),
                                    static_cast<std::size_t>(sv.rend() - it));
        }

        /// Trim whitespace from both ends of the string view.
        inline std::string_view trim(std::string_view sv) noexcept
        {
            return rtrim(ltrim(sv));
        }

        /// Case-insensitive equality comparison without allocations.
        inline bool iequals(std::string_view a, std::string_view b) noexcept
        {
            if (a.size() != b.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i)
            {
                unsigned char ca = static_cast<unsigned char>(a[i]);
                unsigned char cb = static_cast<unsigned char>(b[i]);
                if (std::tolower(ca) != std::tolower(cb))
                {
                    return false;
                }
            }
            return true;
        }

        /// True for a non-empty run of [A-Za-z0-9_]; safe to splice into SQL identifiers.
        inline bool isIdentifier(std::string_view sv) noexcept
        {
            if (sv.empty())
            {
                return false;
            }
            return std::all_of(sv.begin(), sv.end(), [](unsigned char ch) {
                return std::isalnum(ch) != 0 || ch == '_';
            });
        }

        /**
         * Safely parse an integer from a string_view.
         *
         * Returns std::nullopt if parsing fails or if there are
         * non-numeric trailing characters after trimming.
         */
        template <typename IntType>
        std::optional<IntType> parseInteger(std::string_view sv)
        {
            static_assert(std::is_integral<IntType>::value,
                          "parseInteger requires an integral type");

            sv = trim(sv);
            if (sv.empty())
            {
                return std::nullopt;
            }
            // istream happily wraps "-1" into a huge unsigned value.
            if (std::is_unsigned<IntType>::value && sv.front() == '-')
            {
                return std::nullopt;
            }

            std::string s(sv);
            std::istringstream iss(s);
            IntType value{};
            iss >> value;

            if (!iss || !iss.eof())
            {
                return std::nullopt;
            }
            return value;
        }

        /// Escape a string for embedding inside a JSON string literal.
        std::string escapeJson(std::string_view s);

    } // namespace Utils
} // namespace IpSift
