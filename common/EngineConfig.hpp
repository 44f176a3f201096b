#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace lanwatch::common
{
    struct EngineConfig
    {
        // Longest accepted duration for any setting.
        static constexpr std::chrono::hours MAX_DURATION{24};

        // Empty selects the first up, non-loopback IPv4 interface.
        std::string interface;

        std::chrono::milliseconds scanInterval{5000};
        std::chrono::milliseconds stalenessWindow{120000};
        std::chrono::milliseconds probeTimeout{3000};
        std::chrono::milliseconds hostnameTimeout{1000};
        std::chrono::milliseconds protectInterval{1000};
        std::chrono::milliseconds cutInterval{1000};

        bool vendorLookup = true;
        std::string vendorHost = "api.macvendors.com";
        std::chrono::milliseconds vendorTimeout{3000};

        // Applies one "key = value" pair. Returns false and leaves the config
        // untouched for unknown keys or unparsable values.
        bool Set(const std::string &key, const std::string &value);

        // Reads key = value lines; '#' starts a comment. Returns false when the
        // file cannot be opened. Bad lines are reported and skipped.
        bool LoadFile(const std::string &path);

        // $XDG_CONFIG_HOME/lanwatch/lanwatch.conf, else ~/.config/lanwatch/lanwatch.conf
        static std::string DefaultPath();
    };

    // Strips comments and blank lines, trims whitespace.
    std::vector<std::string> ReadConfigLines(const std::string &path, bool *opened = nullptr);
}
