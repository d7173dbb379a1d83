// Core value types for IPv4 addresses and CIDR blocks.
// Both are plain values: cheap to copy, safe to share across worker threads.

#ifndef CORE_IPV4_ADDRESS_HPP
#define CORE_IPV4_ADDRESS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace IpSift
{
namespace core
{

/**
 * @brief A numeric IPv4 address, stored in host byte order.
 *
 * parse() accepts exactly four dot-separated groups of 1-3 decimal digits,
 * each <= 255. Leading zeros are read as decimal ("010" is 10). Anything
 * else (signs, whitespace, empty or extra groups) is rejected.
 */
class Ipv4Address
{
public:
    constexpr Ipv4Address() noexcept = default;

    constexpr explicit Ipv4Address(std::uint32_t value) noexcept
        : m_value(value)
    {
    }

    constexpr Ipv4Address(std::uint8_t a, std::uint8_t b,
                          std::uint8_t c, std::uint8_t d) noexcept
        : m_value((static_cast<std::uint32_t>(a) << 24) |
                  (static_cast<std::uint32_t>(b) << 16) |
                  (static_cast<std::uint32_t>(c) << 8) |
                  static_cast<std::uint32_t>(d))
    {
    }

    /// Parse dotted-quad text; std::nullopt on any syntax or range error.
    static std::optional<Ipv4Address> parse(std::string_view text) noexcept
    {
        std::uint32_t value = 0;
        std::size_t pos = 0;

        for (int group = 0; group < 4; ++group)
        {
            if (group > 0)
            {
                if (pos >= text.size() || text[pos] != '.')
                {
                    return std::nullopt;
                }
                ++pos;
            }

            unsigned octet = 0;
            std::size_t digits = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            {
                if (++digits > 3)
                {
                    return std::nullopt;
                }
                octet = octet * 10 + static_cast<unsigned>(text[pos] - '0');
                ++pos;
            }

            if (digits == 0 || octet > 255)
            {
                return std::nullopt;
            }
            value = (value << 8) | octet;
        }

        if (pos != text.size())
        {
            return std::nullopt;
        }
        return Ipv4Address(value);
    }

    constexpr std::uint32_t value() const noexcept { return m_value; }

    constexpr std::uint8_t octet(int index) const noexcept
    {
        return static_cast<std::uint8_t>(m_value >> (8 * (3 - index)));
    }

    /// 0.0.0.0
    constexpr bool isUnspecified() const noexcept { return m_value == 0; }

    /// 224.0.0.0/4
    constexpr bool isMulticast() const noexcept { return (m_value >> 28) == 0xE; }

    /// 240.0.0.0/4, which includes the limited broadcast 255.255.255.255.
    constexpr bool isReserved() const noexcept { return (m_value >> 28) == 0xF; }

    std::string toString() const
    {
        std::string out;
        out.reserve(15);
        for (int i = 0; i < 4; ++i)
        {
            if (i > 0)
            {
                out.push_back('.');
            }
            out.append(std::to_string(octet(i)));
        }
        return out;
    }

    friend constexpr bool operator==(Ipv4Address a, Ipv4Address b) noexcept { return a.m_value == b.m_value; }
    friend constexpr bool operator!=(Ipv4Address a, Ipv4Address b) noexcept { return a.m_value != b.m_value; }
    friend constexpr bool operator<(Ipv4Address a, Ipv4Address b) noexcept { return a.m_value < b.m_value; }

private:
    std::uint32_t m_value = 0;
};

/**
 * @brief A CIDR block: base address plus prefix length (0-32).
 *
 * The base is normalized on construction, so "10.1.2.3/8" covers the same
 * addresses as "10.0.0.0/8".
 */
class NetworkRange
{
public:
    constexpr NetworkRange(Ipv4Address base, std::uint8_t prefixLength) noexcept
        : m_prefixLength(prefixLength > 32 ? std::uint8_t{32} : prefixLength),
          m_base(Ipv4Address(base.value() & maskFor(m_prefixLength)))
    {
    }

    /// Parse "a.b.c.d/n"; std::nullopt if either part is malformed.
    static std::optional<NetworkRange> fromCidr(std::string_view cidr) noexcept
    {
        const auto slash = cidr.find('/');
        if (slash == std::string_view::npos)
        {
            return std::nullopt;
        }

        const auto base = Ipv4Address::parse(cidr.substr(0, slash));
        const std::string_view prefix = cidr.substr(slash + 1);
        if (!base || prefix.empty() || prefix.size() > 2)
        {
            return std::nullopt;
        }

        unsigned length = 0;
        for (char c : prefix)
        {
            if (c < '0' || c > '9')
            {
                return std::nullopt;
            }
            length = length * 10 + static_cast<unsigned>(c - '0');
        }
        if (length > 32)
        {
            return std::nullopt;
        }
        return NetworkRange(*base, static_cast<std::uint8_t>(length));
    }

    constexpr bool contains(Ipv4Address address) const noexcept
    {
        return (address.value() & maskFor(m_prefixLength)) == m_base.value();
    }

    constexpr Ipv4Address base() const noexcept { return m_base; }
    constexpr std::uint8_t prefixLength() const noexcept { return m_prefixLength; }

    std::string toString() const
    {
        return m_base.toString() + "/" + std::to_string(m_prefixLength);
    }

private:
    static constexpr std::uint32_t maskFor(std::uint8_t prefixLength) noexcept
    {
        return prefixLength == 0 ? 0u : (0xFFFFFFFFu << (32 - prefixLength));
    }

    std::uint8_t m_prefixLength;
    Ipv4Address  m_base;
};

} // namespace core
} // namespace IpSift

#endif // CORE_IPV4_ADDRESS_HPP
