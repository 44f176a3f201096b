#include "HostnameResolver.hpp"

#include <arpa/inet.h>
#include <future>
#include <memory>
#include <netdb.h>
#include <sys/socket.h>
#include <thread>

namespace lanwatch::engine
{
    namespace
    {
        std::optional<std::string> ReverseLookup(const std::string &ip)
        {
            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
                return std::nullopt;

            char host[NI_MAXHOST];
            int rc = getnameinfo(reinterpret_cast<sockaddr *>(&addr), sizeof(addr),
                                 host, sizeof(host), nullptr, 0, NI_NAMEREQD);
            if (rc != 0)
                return std::nullopt;

            std::string name = host;
            if (name.empty() || name == ip)
                return std::nullopt;
            return name;
        }
    }

    std::optional<std::string> SystemHostnameResolver::Lookup(const std::string &ip, std::chrono::milliseconds timeout)
    {
        auto promise = std::make_shared<std::promise<std::optional<std::string>>>();
        std::future<std::optional<std::string>> future = promise->get_future();

        // getnameinfo has no timeout of its own; the thread keeps the promise alive.
        std::thread([promise, ip]()
                    { promise->set_value(ReverseLookup(ip)); })
            .detach();

        if (future.wait_for(timeout) != std::future_status::ready)
            return std::nullopt;
        return future.get();
    }
}
