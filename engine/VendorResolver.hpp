#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace lanwatch::engine
{
    // Remote OUI registry. Returns nullopt when the registry reports the prefix as
    // unknown and throws ResolutionError for anything short of a definitive answer
    // (unreachable, rate limited, timed out).
    class VendorLookup
    {
    public:
        virtual ~VendorLookup() = default;
        virtual std::optional<std::string> Lookup(const std::string &oui) = 0;
    };

    class VendorResolver
    {
    public:
        // `remote` may be null, in which case only the built-in table is used. After a
        // failed remote call the prefix is not asked again for `retryAfter`.
        explicit VendorResolver(VendorLookup *remote = nullptr,
                                std::chrono::milliseconds retryAfter = std::chrono::seconds(30));

        std::optional<std::string> Resolve(const std::string &mac);

        std::size_t RemoteLookups() const { return m_remoteLookups; }
        std::size_t CacheSize() const;

        static std::optional<std::string> StaticVendor(const std::string &oui);

    private:
        // True when `oui` has a definitive answer or is backing off after a failure.
        bool FromCache(const std::string &oui, std::optional<std::string> &vendor) const;

        VendorLookup *m_remote;
        std::chrono::milliseconds m_retryAfter;

        mutable std::mutex m_cacheMutex;
        std::map<std::string, std::optional<std::string>> m_cache;
        std::map<std::string, std::chrono::steady_clock::time_point> m_failedAt;

        // Serializes remote calls so a prefix is fetched once even under contention.
        std::mutex m_remoteMutex;
        std::atomic<std::size_t> m_remoteLookups{0};
    };
}
