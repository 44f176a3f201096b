#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "../common/Device.hpp"

namespace lanwatch::engine
{
    struct ArpReply
    {
        std::string ip;
        std::string mac;
        common::Clock::time_point seenAt{};
    };

    // One unsolicited ARP reply: tells `targetIp`/`targetMac` that `senderIp`
    // is at `senderMac`.
    struct ArpAnnouncement
    {
        std::string targetIp;
        std::string targetMac;
        std::string senderIp;
        std::string senderMac;
    };

    class ArpTransport
    {
    public:
        virtual ~ArpTransport() = default;

        // Broadcasts a request to every target and collects replies for `timeout`.
        // Throws PrivilegeError when raw capture is unavailable.
        virtual std::vector<ArpReply> Probe(const std::string &iface,
                                            const std::vector<std::string> &targets,
                                            std::chrono::milliseconds timeout) = 0;

        // Targeted request for a single address; nullopt when nobody answers.
        virtual std::optional<std::string> Resolve(const std::string &iface, const std::string &ip) = 0;

        // Returns false when the frame could not be sent.
        virtual bool Announce(const std::string &iface, const ArpAnnouncement &announcement) = 0;

        virtual std::optional<std::string> LocalMac(const std::string &iface) = 0;
    };
}
