#include "analysis/AddressClassifier.hpp"

#include <algorithm>
#include <utility>

#include "utils/Logger.hpp"

namespace IpSift
{
namespace Analysis
{
    const char *toString(AddressClass cls) noexcept
    {
        switch (cls)
        {
        case AddressClass::Private: return "private";
        case AddressClass::Public:  return "public";
        case AddressClass::Invalid: return "invalid";
        default:                    return "unknown";
        }
    }

    AddressClassifier::AddressClassifier(std::vector<core::NetworkRange> privateRanges)
        : m_privateRanges(std::move(privateRanges))
    {
        Utils::getLogger().debug("AddressClassifier initialized with " +
                                 std::to_string(m_privateRanges.size()) + " private ranges");
    }

    AddressClassifier AddressClassifier::withDefaultRanges()
    {
        return AddressClassifier({
            core::NetworkRange(core::Ipv4Address(10, 0, 0, 0), 8),
            core::NetworkRange(core::Ipv4Address(172, 16, 0, 0), 12),
            core::NetworkRange(core::Ipv4Address(192, 168, 0, 0), 16),
        });
    }

    AddressClass AddressClassifier::classify(std::string_view candidate) const noexcept
    {
        const auto address = core::Ipv4Address::parse(candidate);
        if (!address)
        {
            return AddressClass::Invalid;
        }
        return classify(*address);
    }

    AddressClass AddressClassifier::classify(core::Ipv4Address address) const noexcept
    {
        if (address.isUnspecified() || address.isReserved() || address.isMulticast())
        {
            return AddressClass::Invalid;
        }

        const bool inPrivateRange = std::any_of(
            m_privateRanges.begin(), m_privateRanges.end(),
            [address](const core::NetworkRange &range) { return range.contains(address); });

        return inPrivateRange ? AddressClass::Private : AddressClass::Public;
    }

} // namespace Analysis
} // namespace IpSift
