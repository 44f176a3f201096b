#include "PlatformFactory.hpp"
#include "LinuxPlatformAdapter.hpp"
#include "MacOSPlatformAdapter.hpp"
#include "WindowsPlatformAdapter.hpp"

namespace lanwatch::platform
{
    const char *ToString(OsType os)
    {
        switch (os)
        {
        case OsType::Linux:
            return "linux";
        case OsType::MacOS:
            return "macos";
        case OsType::Windows:
            return "windows";
        case OsType::Unsupported:
            return "unsupported";
        }
        return "unsupported";
    }

    std::optional<OsType> ParseOsType(const std::string &name)
    {
        if (name == "linux")
            return OsType::Linux;
        if (name == "macos" || name == "darwin")
            return OsType::MacOS;
        if (name == "windows")
            return OsType::Windows;
        return std::nullopt;
    }

    OsType PlatformFactory::DetectOs()
    {
#if defined(__linux__)
        return OsType::Linux;
#elif defined(__APPLE__)
        return OsType::MacOS;
#elif defined(_WIN32)
        return OsType::Windows;
#else
        return OsType::Unsupported;
#endif
    }

    std::unique_ptr<PlatformAdapter> PlatformFactory::Create(OsType os, CommandRunner &runner)
    {
        switch (os)
        {
        case OsType::Linux:
            return std::make_unique<LinuxPlatformAdapter>(runner);
        case OsType::MacOS:
            return std::make_unique<MacOSPlatformAdapter>(runner);
        case OsType::Windows:
            return std::make_unique<WindowsPlatformAdapter>(runner);
        case OsType::Unsupported:
            break;
        }
        return nullptr;
    }
}
