#include "TinsArpTransport.hpp"
#include "../common/Address.hpp"
#include "../common/Errors.hpp"

#include <tins/tins.h>

#include <iostream>
#include <poll.h>
#include <set>
#include <thread>
#include <unistd.h>

namespace lanwatch::engine
{
    namespace
    {
        bool IsRoot()
        {
            return geteuid() == 0;
        }
    }

    TinsArpTransport::TinsArpTransport()
        : m_sender(std::make_unique<Tins::PacketSender>())
    {
    }

    TinsArpTransport::~TinsArpTransport() = default;

    std::vector<ArpReply> TinsArpTransport::Probe(const std::string &iface,
                                                  const std::vector<std::string> &targets,
                                                  std::chrono::milliseconds timeout)
    {
        std::vector<ArpReply> replies;
        if (!IsRoot())
            throw common::PrivilegeError("active ARP probe requires root");

        Tins::NetworkInterface netIface;
        Tins::NetworkInterface::Info info;
        try
        {
            netIface = Tins::NetworkInterface(iface);
            info = netIface.info();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Discovery] Interface " << iface << " unavailable: " << e.what() << "\n";
            return replies;
        }

        Tins::SnifferConfiguration config;
        config.set_promisc_mode(false);
        config.set_immediate_mode(true);
        config.set_filter("arp");
        config.set_timeout(100);

        std::unique_ptr<Tins::Sniffer> sniffer;
        try
        {
            sniffer = std::make_unique<Tins::Sniffer>(iface, config);
        }
        catch (const std::exception &e)
        {
            throw common::PrivilegeError(std::string("cannot open capture on ") + iface + ": " + e.what());
        }

        std::set<std::string> wanted(targets.begin(), targets.end());
        std::set<std::string> seen;

        auto collect = [&](int waitMs)
        {
            pollfd pfd{};
            pfd.fd = sniffer->get_fd();
            pfd.events = POLLIN;
            if (poll(&pfd, 1, waitMs) <= 0 || !(pfd.revents & POLLIN))
                return;

            Tins::PtrPacket packet = sniffer->next_packet();
            std::unique_ptr<Tins::PDU> pdu(packet.release_pdu());
            if (!pdu)
                return;

            const Tins::ARP *arp = pdu->find_pdu<Tins::ARP>();
            if (!arp || arp->opcode() != Tins::ARP::REPLY)
                return;

            std::string ip = arp->sender_ip_addr().to_string();
            std::string mac = common::CanonicalMac(arp->sender_hw_addr().to_string());
            if (!wanted.count(ip) || mac.empty() || !seen.insert(ip).second)
                return;

            replies.push_back({ip, mac, common::Clock::now()});
        };

        for (const auto &target : targets)
        {
            try
            {
                Tins::EthernetII request = Tins::ARP::make_arp_request(
                    Tins::IPv4Address(target), info.ip_addr, info.hw_addr);
                {
                    std::lock_guard<std::mutex> lock(m_senderMutex);
                    m_sender->send(request, netIface);
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Discovery] Request to " << target << " failed: " << e.what() << "\n";
            }
            // Drain early replies so the kernel buffer does not overflow on large ranges.
            collect(0);
            std::this_thread::sleep_for(std::chrono::microseconds(300));
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
            collect(100);

        return replies;
    }

    std::optional<std::string> TinsArpTransport::Resolve(const std::string &iface, const std::string &ip)
    {
        if (!IsRoot())
            return std::nullopt;

        try
        {
            Tins::NetworkInterface netIface(iface);
            std::lock_guard<std::mutex> lock(m_senderMutex);
            Tins::HWAddress<6> hw = Tins::Utils::resolve_hwaddr(netIface, Tins::IPv4Address(ip), *m_sender);
            std::string mac = common::CanonicalMac(hw.to_string());
            if (mac.empty())
                return std::nullopt;
            return mac;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Gateway] ARP resolution of " << ip << " failed: " << e.what() << "\n";
            return std::nullopt;
        }
    }

    bool TinsArpTransport::Announce(const std::string &iface, const ArpAnnouncement &announcement)
    {
        try
        {
            Tins::NetworkInterface netIface(iface);
            Tins::NetworkInterface::Info info = netIface.info();

            Tins::EthernetII reply = Tins::ARP::make_arp_reply(
                Tins::IPv4Address(announcement.targetIp),
                Tins::IPv4Address(announcement.senderIp),
                Tins::HWAddress<6>(announcement.targetMac),
                Tins::HWAddress<6>(announcement.senderMac));
            // The claimed mapping lives in the ARP payload; the frame itself comes from us.
            reply.src_addr(info.hw_addr);

            std::lock_guard<std::mutex> lock(m_senderMutex);
            m_sender->send(reply, netIface);
            return true;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[AccessControl] Send to " << announcement.targetIp << " failed: " << e.what() << "\n";
            return false;
        }
    }

    std::optional<std::string> TinsArpTransport::LocalMac(const std::string &iface)
    {
        try
        {
            Tins::NetworkInterface netIface(iface);
            std::string mac = common::CanonicalMac(netIface.info().hw_addr.to_string());
            if (mac.empty())
                return std::nullopt;
            return mac;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[AccessControl] No link-layer address for " << iface << ": " << e.what() << "\n";
            return std::nullopt;
        }
    }
}
