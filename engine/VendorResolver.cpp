#include "VendorResolver.hpp"
#include "../common/Address.hpp"

#include <exception>
#include <iostream>

namespace lanwatch::engine
{
    namespace
    {
        const std::map<std::string, std::string> &StaticTable()
        {
            static const std::map<std::string, std::string> table = {
                {"B827EB", "Raspberry Pi Foundation"},
                {"DCA632", "Raspberry Pi Trading"},
                {"E45F01", "Raspberry Pi Trading"},
                {"005056", "VMware"},
                {"000C29", "VMware"},
                {"080027", "Oracle VirtualBox"},
                {"000393", "Apple"},
                {"F01898", "Apple"},
                {"A483E7", "Apple"},
                {"ACBC32", "Apple"},
                {"F4F5D8", "Google"},
                {"3C5AB4", "Google"},
                {"44650D", "Amazon Technologies"},
                {"F0272D", "Amazon Technologies"},
                {"74C246", "Amazon Technologies"},
                {"0009BF", "Nintendo"},
                {"98B6E9", "Nintendo"},
                {"00D9D1", "Sony Interactive Entertainment"},
                {"001422", "Dell"},
                {"F8BC12", "Dell"},
                {"00000C", "Cisco Systems"},
                {"50C7BF", "TP-Link"},
                {"F4F26D", "TP-Link"},
                {"001132", "Synology"},
                {"000E58", "Sonos"},
                {"B8E937", "Sonos"},
                {"B0A737", "Roku"},
                {"240AC4", "Espressif"},
                {"30AEA4", "Espressif"},
                {"18FE34", "Espressif"},
                {"001788", "Philips Lighting"},
                {"18B430", "Nest Labs"},
            };
            return table;
        }
    }

    VendorResolver::VendorResolver(VendorLookup *remote, std::chrono::milliseconds retryAfter)
        : m_remote(remote), m_retryAfter(retryAfter)
    {
    }

    std::optional<std::string> VendorResolver::StaticVendor(const std::string &oui)
    {
        const auto &table = StaticTable();
        auto it = table.find(oui);
        if (it == table.end())
            return std::nullopt;
        return it->second;
    }

    std::size_t VendorResolver::CacheSize() const
    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        return m_cache.size();
    }

    bool VendorResolver::FromCache(const std::string &oui, std::optional<std::string> &vendor) const
    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        auto it = m_cache.find(oui);
        if (it != m_cache.end())
        {
            vendor = it->second;
            return true;
        }

        auto failed = m_failedAt.find(oui);
        if (failed != m_failedAt.end() && std::chrono::steady_clock::now() - failed->second < m_retryAfter)
        {
            vendor.reset();
            return true;
        }
        return false;
    }

    std::optional<std::string> VendorResolver::Resolve(const std::string &mac)
    {
        std::string canonical = common::CanonicalMac(mac);
        if (canonical.empty())
            return std::nullopt;
        std::string oui = common::OuiPrefix(canonical);

        auto known = StaticVendor(oui);
        if (known)
            return known;

        std::optional<std::string> vendor;
        if (FromCache(oui, vendor))
            return vendor;
        if (!m_remote)
            return std::nullopt;

        std::lock_guard<std::mutex> remoteLock(m_remoteMutex);
        if (FromCache(oui, vendor))
            return vendor;

        ++m_remoteLookups;
        try
        {
            vendor = m_remote->Lookup(oui);
        }
        catch (const std::exception &e)
        {
            // Only definitive answers are cached; this prefix is asked again later.
            std::cerr << "[Vendor] Lookup for " << oui << " failed: " << e.what() << "\n";
            std::lock_guard<std::mutex> lock(m_cacheMutex);
            m_failedAt[oui] = std::chrono::steady_clock::now();
            return std::nullopt;
        }

        std::lock_guard<std::mutex> lock(m_cacheMutex);
        m_failedAt.erase(oui);
        m_cache.emplace(oui, vendor);
        return vendor;
    }
}
