#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lanwatch::engine
{
    // Keyword match over hostname and vendor. First category in table order wins.
    class DeviceClassifier
    {
    public:
        static constexpr const char *UNKNOWN = "unknown";

        static std::string Classify(const std::optional<std::string> &hostname,
                                    const std::optional<std::string> &vendor);

        static const std::vector<std::pair<std::string, std::vector<std::string>>> &Categories();
    };
}
