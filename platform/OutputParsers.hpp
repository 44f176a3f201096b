#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "PlatformAdapter.hpp"

// Pure text parsers for the native tools each backend shells out to. Kept apart
// from the backends so they can be fed captured output.
namespace lanwatch::platform::parsers
{
    struct LinkState
    {
        std::string mac;
        bool isUp = false;
        bool isLoopback = false;
    };

    struct DefaultRoute
    {
        std::string gateway;
        std::string interfaceName;
    };

    // ---- Linux ----
    std::vector<NeighborEntry> ParseProcNetArp(const std::string &content);
    std::vector<NeighborEntry> ParseIpNeigh(const std::string &output);
    std::map<std::string, LinkState> ParseIpLink(const std::string &output);
    // `ip -o -4 addr show`: name -> (ip, netmask); first address per interface wins.
    std::map<std::string, std::pair<std::string, std::string>> ParseIpAddr(const std::string &output);
    std::optional<DefaultRoute> ParseProcNetRoute(const std::string &content);
    std::optional<DefaultRoute> ParseIpRouteDefault(const std::string &output);
    std::vector<InterfaceCounters> ParseProcNetDev(const std::string &content);
    std::vector<std::string> ParseIwDevInterfaces(const std::string &output);
    std::optional<int> ParseIwStationSignal(const std::string &output);

    // ---- macOS ----
    std::vector<NeighborEntry> ParseArpAn(const std::string &output);
    std::vector<InterfaceInfo> ParseIfconfig(const std::string &output);
    std::vector<std::string> ParseNetworkSetupWifi(const std::string &output);
    std::optional<DefaultRoute> ParseRouteGetDefault(const std::string &output);
    std::vector<InterfaceCounters> ParseNetstatIbn(const std::string &output);
    // Returns (bssid, rssi) from `airport -I`.
    std::optional<std::pair<std::string, int>> ParseAirportInfo(const std::string &output);
    // `pfctl -t <table> -T show`: one address per line.
    std::set<std::string> ParsePfTableShow(const std::string &output);
    // `pfctl -s dummynet`: host -> pipe for rules naming a single host.
    std::map<std::string, unsigned> ParsePfDummynetRules(const std::string &output);

    // ---- Windows ----
    std::vector<NeighborEntry> ParseWindowsArp(const std::string &output);
    std::vector<InterfaceInfo> ParseIpconfigAll(const std::string &output);
    std::optional<std::string> ParseIpconfigGateway(const std::string &output);
    std::vector<std::string> ParseNetshWlanNames(const std::string &output);
    // Returns (bssid, signal percent) from `netsh wlan show interfaces`.
    std::optional<std::pair<std::string, int>> ParseNetshWlanSignal(const std::string &output);
    std::vector<InterfaceCounters> ParseNetstatE(const std::string &output);

    int PercentToDbm(int percent);
}
