#pragma once

#include <string_view>
#include <vector>

#include "core/Ipv4Address.hpp"

namespace IpSift
{
namespace Analysis
{
    enum class AddressClass
    {
        Private,
        Public,
        Invalid,
    };

    const char *toString(AddressClass cls) noexcept;

    /**
     * AddressClassifier
     *
     * Decides whether a textual IPv4 candidate is private, public, or
     * excluded altogether.
     *
     * Rules, in order:
     *  - text that does not parse as a dotted quad is Invalid;
     *  - the unspecified (0.0.0.0), reserved (240.0.0.0/4) and multicast
     *    (224.0.0.0/4) addresses are Invalid;
     *  - an address inside one of the configured private ranges is Private;
     *  - everything else is Public, loopback and link-local included.
     *
     * The range list is fixed at construction; classify() is const and
     * never throws, so one instance is shared by all workers.
     */
    class AddressClassifier
    {
    public:
        explicit AddressClassifier(std::vector<core::NetworkRange> privateRanges);

        /// 10.0.0.0/8, 172.16.0.0/12 and 192.168.0.0/16.
        static AddressClassifier withDefaultRanges();

        AddressClass classify(std::string_view candidate) const noexcept;
        AddressClass classify(core::Ipv4Address address) const noexcept;

        const std::vector<core::NetworkRange> &privateRanges() const noexcept { return m_privateRanges; }

    private:
        std::vector<core::NetworkRange> m_privateRanges;
    };

} // namespace Analysis
} // namespace IpSift
