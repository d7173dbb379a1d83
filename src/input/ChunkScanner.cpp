#include "input/ChunkScanner.hpp"

#include "utils/Logger.hpp"

namespace IpSift
{
    namespace Input
    {
        namespace
        {
            constexpr const char *kIpv4Pattern =
                R"(\b(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3})"
                R"((?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\b)";
        } // anonymous namespace

        ChunkScanner::ChunkScanner()
            : m_pattern(kIpv4Pattern, std::regex::ECMAScript | std::regex::optimize)
        {
            Utils::getLogger().debug("ChunkScanner initialized");
        }

        const char *ChunkScanner::pattern() noexcept
        {
            return kIpv4Pattern;
        }

        std::unordered_set<std::string> ChunkScanner::scan(std::string_view chunk) const
        {
            std::unordered_set<std::string> found;

            const char *begin = chunk.data();
            const char *end   = chunk.data() + chunk.size();

            for (std::cregex_iterator it(begin, end, m_pattern), last; it != last; ++it)
            {
                found.insert(it->str());
            }
            return found;
        }

        ChunkResult ChunkScanner::process(std::string_view chunk,
                                          const Analysis::AddressClassifier &classifier) const
        {
            ChunkResult result;
            auto candidates = scan(chunk);
            result.candidates = candidates.size();

            for (auto it = candidates.begin(); it != candidates.end();)
            {
                auto node = candidates.extract(it++);
                switch (classifier.classify(node.value()))
                {
                case Analysis::AddressClass::Private:
                    result.privateAddresses.insert(std::move(node));
                    break;
                case Analysis::AddressClass::Public:
                    result.publicAddresses.insert(std::move(node));
                    break;
                case Analysis::AddressClass::Invalid:
                    ++result.excluded;
                    break;
                }
            }
            return result;
        }

    } // namespace Input
} // namespace IpSift
