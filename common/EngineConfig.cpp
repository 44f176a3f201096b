#include "EngineConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <pwd.h>
#include <unistd.h>

namespace lanwatch::common
{
    namespace
    {
        std::string Trim(const std::string &s)
        {
            size_t first = s.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return "";
            size_t last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }

        bool ParseMillis(const std::string &value, std::chrono::milliseconds &out)
        {
            // Plain numbers are seconds; an "ms" suffix selects milliseconds.
            std::string v = value;
            bool millis = false;
            if (v.size() > 2 && v.compare(v.size() - 2, 2, "ms") == 0)
            {
                millis = true;
                v = v.substr(0, v.size() - 2);
            }
            else if (v.size() > 1 && v.back() == 's')
            {
                v.pop_back();
            }

            try
            {
                size_t pos = 0;
                double number = std::stod(v, &pos);
                if (pos != v.size() || !std::isfinite(number) || number < 0)
                    return false;

                double ms = millis ? number : number * 1000.0;
                if (ms > static_cast<double>(std::chrono::milliseconds(EngineConfig::MAX_DURATION).count()))
                    return false;
                out = std::chrono::milliseconds(static_cast<long long>(ms));
                return true;
            }
            catch (const std::exception &)
            {
                return false;
            }
        }

        bool ParseBool(const std::string &value, bool &out)
        {
            std::string v = value;
            std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            if (v == "1" || v == "true" || v == "yes" || v == "on")
            {
                out = true;
                return true;
            }
            if (v == "0" || v == "false" || v == "no" || v == "off")
            {
                out = false;
                return true;
            }
            return false;
        }
    }

    std::vector<std::string> ReadConfigLines(const std::string &path, bool *opened)
    {
        std::vector<std::string> lines;
        std::ifstream file(path);
        if (opened)
            *opened = file.is_open();
        if (!file.is_open())
            return lines;

        std::string line;
        while (std::getline(file, line))
        {
            std::string trimmed = Trim(line);
            if (trimmed.empty() || trimmed[0] == '#')
                continue;
            lines.push_back(trimmed);
        }
        return lines;
    }

    bool EngineConfig::Set(const std::string &key, const std::string &value)
    {
        if (key == "interface")
        {
            interface = value;
            return true;
        }
        if (key == "vendor_host")
        {
            if (value.empty())
                return false;
            vendorHost = value;
            return true;
        }
        if (key == "vendor_lookup")
            return ParseBool(value, vendorLookup);

        std::chrono::milliseconds *target = nullptr;
        if (key == "scan_interval")
            target = &scanInterval;
        else if (key == "staleness_window")
            target = &stalenessWindow;
        else if (key == "probe_timeout")
            target = &probeTimeout;
        else if (key == "hostname_timeout")
            target = &hostnameTimeout;
        else if (key == "protect_interval")
            target = &protectInterval;
        else if (key == "cut_interval")
            target = &cutInterval;
        else if (key == "vendor_timeout")
            target = &vendorTimeout;

        if (!target)
            return false;

        std::chrono::milliseconds parsed{0};
        if (!ParseMillis(value, parsed))
            return false;
        if (parsed.count() == 0 && (target == &scanInterval || target == &protectInterval || target == &cutInterval))
            return false;

        *target = parsed;
        return true;
    }

    bool EngineConfig::LoadFile(const std::string &path)
    {
        bool opened = false;
        auto lines = ReadConfigLines(path, &opened);
        if (!opened)
            return false;

        for (const auto &line : lines)
        {
            size_t eq = line.find('=');
            if (eq == std::string::npos)
            {
                std::cerr << "[Config] Ignoring malformed line in " << path << ": " << line << "\n";
                continue;
            }

            std::string key = Trim(line.substr(0, eq));
            std::string value = Trim(line.substr(eq + 1));
            if (!Set(key, value))
            {
                std::cerr << "[Config] Ignoring invalid setting '" << key << "' in " << path << "\n";
            }
        }
        return true;
    }

    std::string EngineConfig::DefaultPath()
    {
        const char *xdg = std::getenv("XDG_CONFIG_HOME");
        if (xdg && xdg[0] != '\0')
            return std::string(xdg) + "/lanwatch/lanwatch.conf";

        const char *home = std::getenv("HOME");
        if (!home || home[0] == '\0')
        {
            struct passwd *pw = getpwuid(getuid());
            if (pw)
                home = pw->pw_dir;
        }
        if (home)
            return std::string(home) + "/.config/lanwatch/lanwatch.conf";

        return "./lanwatch.conf";
    }
}
