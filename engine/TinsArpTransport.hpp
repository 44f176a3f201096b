#pragma once

#include <memory>
#include <mutex>

#include "ArpTransport.hpp"

namespace Tins
{
    class PacketSender;
}

namespace lanwatch::engine
{
    // Raw ARP over libtins. Needs root (or CAP_NET_RAW) for both the sniffer and the sender.
    class TinsArpTransport : public ArpTransport
    {
    public:
        TinsArpTransport();
        ~TinsArpTransport();

        std::vector<ArpReply> Probe(const std::string &iface,
                                    const std::vector<std::string> &targets,
                                    std::chrono::milliseconds timeout) override;

        std::optional<std::string> Resolve(const std::string &iface, const std::string &ip) override;

        bool Announce(const std::string &iface, const ArpAnnouncement &announcement) override;

        std::optional<std::string> LocalMac(const std::string &iface) override;

    private:
        std::mutex m_senderMutex;
        std::unique_ptr<Tins::PacketSender> m_sender;
    };
}
