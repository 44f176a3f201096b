#pragma once

#include <memory>
#include <optional>
#include <string>

#include "CommandRunner.hpp"
#include "PlatformAdapter.hpp"

namespace lanwatch::platform
{
    enum class OsType
    {
        Linux,
        MacOS,
        Windows,
        Unsupported
    };

    const char *ToString(OsType os);
    std::optional<OsType> ParseOsType(const std::string &name);

    class PlatformFactory
    {
    public:
        static OsType DetectOs();

        // Returns nullptr for Unsupported. `runner` must outlive the adapter.
        static std::unique_ptr<PlatformAdapter> Create(OsType os, CommandRunner &runner);
    };
}
