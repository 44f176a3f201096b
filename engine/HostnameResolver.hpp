#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace lanwatch::engine
{
    class HostnameResolver
    {
    public:
        virtual ~HostnameResolver() = default;

        // Reverse lookup. nullopt on no answer or timeout; never throws.
        virtual std::optional<std::string> Lookup(const std::string &ip, std::chrono::milliseconds timeout) = 0;
    };

    // getnameinfo(3) on a helper thread; a lookup that outlives its timeout is
    // abandoned and its result dropped.
    class SystemHostnameResolver : public HostnameResolver
    {
    public:
        std::optional<std::string> Lookup(const std::string &ip, std::chrono::milliseconds timeout) override;
    };
}
