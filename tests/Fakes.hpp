#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../common/Errors.hpp"
#include "../engine/ArpTransport.hpp"
#include "../engine/HostnameResolver.hpp"
#include "../engine/VendorResolver.hpp"
#include "../platform/CommandRunner.hpp"
#include "../platform/PlatformAdapter.hpp"

namespace lanwatch::test
{
    // Answers by the longest registered command prefix; everything else exits 0 with no output.
    class FakeCommandRunner : public platform::CommandRunner
    {
    public:
        platform::CommandOutput Run(const std::vector<std::string> &argv, const std::string &input = "") override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::string joined = platform::JoinCommand(argv);
            calls.push_back(joined);
            inputs.push_back(input);

            if (missing.count(argv.empty() ? "" : argv[0]))
                throw common::CommandError("command not found: " + argv[0], 127);

            const platform::CommandOutput *best = nullptr;
            std::size_t bestLength = 0;
            for (const auto &[prefix, output] : responses)
            {
                if (joined.compare(0, prefix.size(), prefix) == 0 && prefix.size() >= bestLength)
                {
                    best = &output;
                    bestLength = prefix.size();
                }
            }
            if (best)
                return *best;
            return platform::CommandOutput{0, ""};
        }

        void Respond(const std::string &prefix, int exitCode, const std::string &output = "")
        {
            responses[prefix] = platform::CommandOutput{exitCode, output};
        }

        std::size_t CountCalls(const std::string &prefix) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::size_t n = 0;
            for (const auto &call : calls)
            {
                if (call.compare(0, prefix.size(), prefix) == 0)
                    ++n;
            }
            return n;
        }

        std::map<std::string, platform::CommandOutput> responses;
        std::map<std::string, bool> missing;
        std::vector<std::string> calls;
        std::vector<std::string> inputs;

    private:
        mutable std::mutex m_mutex;
    };

    class FakePlatformAdapter : public platform::PlatformAdapter
    {
    public:
        std::string Name() const override { return "fake"; }
        bool HasElevatedPrivilege() override { return privileged; }

        std::vector<platform::InterfaceInfo> ListInterfaces() override { return interfaces; }
        std::vector<std::string> ListWifiInterfaces() override { return wifi; }

        std::vector<platform::NeighborEntry> ReadNeighborTable() override
        {
            ++neighborReads;
            return neighbors;
        }

        bool BlockHost(const std::string &ip) override
        {
            ++blockCalls;
            if (blockOk)
                blocked[ip] = true;
            return blockOk;
        }

        bool UnblockHost(const std::string &ip) override
        {
            ++unblockCalls;
            if (unblockOk)
                blocked.erase(ip);
            return unblockOk;
        }

        bool LimitHost(const std::string &ip, std::uint64_t kbps) override
        {
            if (limitOk)
                limits[ip] = kbps;
            return limitOk;
        }

        bool UnlimitHost(const std::string &ip) override
        {
            limits.erase(ip);
            return unlimitOk;
        }

        std::optional<int> WifiSignal(const std::string &mac) override
        {
            auto it = signals.find(mac);
            if (it == signals.end())
                return std::nullopt;
            return it->second;
        }

        std::optional<std::string> DefaultGateway() override { return gateway; }

        std::vector<platform::InterfaceCounters> ReadInterfaceCounters() override
        {
            std::lock_guard<std::mutex> lock(counterMutex);
            return counters;
        }

        void SetCounters(std::vector<platform::InterfaceCounters> next)
        {
            std::lock_guard<std::mutex> lock(counterMutex);
            counters = std::move(next);
        }

        bool privileged = true;
        std::vector<platform::InterfaceInfo> interfaces;
        std::vector<std::string> wifi;
        std::vector<platform::NeighborEntry> neighbors;
        std::map<std::string, int> signals;
        std::optional<std::string> gateway;

        bool blockOk = true;
        bool unblockOk = true;
        bool limitOk = true;
        bool unlimitOk = true;
        std::map<std::string, bool> blocked;
        std::map<std::string, std::uint64_t> limits;
        std::atomic<int> blockCalls{0};
        std::atomic<int> unblockCalls{0};
        std::atomic<int> neighborReads{0};

        std::mutex counterMutex;
        std::vector<platform::InterfaceCounters> counters;
    };

    class FakeArpTransport : public engine::ArpTransport
    {
    public:
        std::vector<engine::ArpReply> Probe(const std::string &, const std::vector<std::string> &targets,
                                            std::chrono::milliseconds) override
        {
            ++probeCalls;
            lastTargets = targets;
            if (denyPrivilege)
                throw common::PrivilegeError("no capture handle");
            return replies;
        }

        std::optional<std::string> Resolve(const std::string &, const std::string &ip) override
        {
            ++resolveCalls;
            auto it = resolvable.find(ip);
            if (it == resolvable.end())
                return std::nullopt;
            return it->second;
        }

        bool Announce(const std::string &, const engine::ArpAnnouncement &announcement) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            sent.push_back(announcement);
            return announceOk;
        }

        std::optional<std::string> LocalMac(const std::string &) override { return localMac; }

        std::vector<engine::ArpAnnouncement> Sent() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return sent;
        }

        void ClearSent()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            sent.clear();
        }

        bool denyPrivilege = false;
        std::vector<engine::ArpReply> replies;
        std::vector<std::string> lastTargets;
        std::map<std::string, std::string> resolvable;
        std::optional<std::string> localMac = std::string("02:00:00:00:00:01");
        std::atomic<bool> announceOk{true};
        std::atomic<int> probeCalls{0};
        std::atomic<int> resolveCalls{0};

    private:
        mutable std::mutex m_mutex;
        std::vector<engine::ArpAnnouncement> sent;
    };

    class FakeVendorLookup : public engine::VendorLookup
    {
    public:
        std::optional<std::string> Lookup(const std::string &oui) override
        {
            ++calls;
            if (unreachable)
                throw common::ResolutionError("registry unreachable");
            if (garbled)
                throw std::runtime_error("unexpected reply");
            auto it = vendors.find(oui);
            if (it == vendors.end())
                return std::nullopt;
            return it->second;
        }

        std::map<std::string, std::string> vendors;
        bool unreachable = false;
        bool garbled = false;
        std::atomic<int> calls{0};
    };

    class FakeHostnameResolver : public engine::HostnameResolver
    {
    public:
        std::optional<std::string> Lookup(const std::string &ip, std::chrono::milliseconds) override
        {
            ++calls;
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = names.find(ip);
            if (it == names.end())
                return std::nullopt;
            return it->second;
        }

        std::map<std::string, std::string> names;
        std::atomic<int> calls{0};

    private:
        std::mutex m_mutex;
    };

    // Polls until `predicate` holds or `timeout` passes.
    inline bool WaitFor(const std::function<bool()> &predicate,
                        std::chrono::milliseconds timeout = std::chrono::seconds(2))
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

    inline platform::InterfaceInfo MakeInterface(const std::string &name, const std::string &ip,
                                                 const std::string &netmask = "255.255.255.0")
    {
        platform::InterfaceInfo info;
        info.name = name;
        info.ip = ip;
        info.netmask = netmask;
        info.mac = "02:00:00:00:00:01";
        info.isUp = true;
        return info;
    }

    inline common::DeviceObservation MakeObservation(const std::string &ip, const std::string &mac)
    {
        common::DeviceObservation obs;
        obs.ip = ip;
        obs.mac = mac;
        obs.interfaceName = "eth0";
        obs.connectionType = common::ConnectionType::Wired;
        obs.observedAt = common::Clock::now();
        return obs;
    }
}
