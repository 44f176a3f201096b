#include "DeviceClassifier.hpp"

#include <algorithm>
#include <cctype>

namespace lanwatch::engine
{
    namespace
    {
        // Keywords up to this length only match as a whole word ("hp" must not fire
        // inside "php"); digits count as a boundary so "ps5" and "pc01" still match.
        constexpr std::size_t SHORT_KEYWORD = 4;

        bool ContainsKeyword(const std::string &haystack, const std::string &keyword)
        {
            if (keyword.size() > SHORT_KEYWORD)
                return haystack.find(keyword) != std::string::npos;

            for (size_t pos = haystack.find(keyword); pos != std::string::npos; pos = haystack.find(keyword, pos + 1))
            {
                size_t end = pos + keyword.size();
                bool before = pos == 0 || !std::isalpha(static_cast<unsigned char>(haystack[pos - 1]));
                bool after = end == haystack.size() || !std::isalpha(static_cast<unsigned char>(haystack[end]));
                if (before && after)
                    return true;
            }
            return false;
        }
    }

    const std::vector<std::pair<std::string, std::vector<std::string>>> &DeviceClassifier::Categories()
    {
        static const std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
            {"phone", {"iphone", "android", "phone", "pixel", "galaxy", "redmi", "oneplus", "huawei", "xiaomi"}},
            {"laptop", {"macbook", "laptop", "thinkpad", "notebook", "ultrabook", "xps"}},
            {"tablet", {"ipad", "tablet", "kindle", "surface"}},
            {"smart-tv", {"tv", "roku", "chromecast", "firetv", "appletv", "bravia", "webos", "tizen"}},
            {"gaming", {"xbox", "playstation", "ps4", "ps5", "nintendo", "switch", "sony interactive"}},
            {"iot", {"echo", "alexa", "nest", "hue", "philips", "sonos", "ring", "espressif", "tuya", "shelly", "raspberry"}},
            {"desktop", {"desktop", "imac", "pc", "workstation", "dell", "hp", "lenovo", "vmware", "virtualbox"}},
        };
        return categories;
    }

    std::string DeviceClassifier::Classify(const std::optional<std::string> &hostname,
                                           const std::optional<std::string> &vendor)
    {
        std::string haystack;
        if (hostname)
            haystack += *hostname;
        haystack += ' ';
        if (vendor)
            haystack += *vendor;

        std::transform(haystack.begin(), haystack.end(), haystack.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        for (const auto &[category, keywords] : Categories())
        {
            for (const auto &keyword : keywords)
            {
                if (ContainsKeyword(haystack, keyword))
                    return category;
            }
        }
        return UNKNOWN;
    }
}
