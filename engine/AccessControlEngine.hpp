#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "ArpTransport.hpp"
#include "DeviceRegistry.hpp"
#include "GatewayResolver.hpp"
#include "../common/Result.hpp"

namespace lanwatch::engine
{
    enum class ControlState
    {
        Idle,
        Protecting,
        Cutting
    };

    const char *ToString(ControlState state);

    // Per-device protect/cut workers. Each worker owns a cancellation flag and is
    // joined before the call that stops it returns.
    class AccessControlEngine
    {
    public:
        static constexpr int MAX_SEND_FAILURES = 5;

        AccessControlEngine(DeviceRegistry &registry,
                            GatewayResolver &gateway,
                            ArpTransport &transport,
                            std::string interfaceName,
                            std::chrono::milliseconds protectInterval = std::chrono::seconds(1),
                            std::chrono::milliseconds cutInterval = std::chrono::seconds(1));
        ~AccessControlEngine();

        AccessControlEngine(const AccessControlEngine &) = delete;
        AccessControlEngine &operator=(const AccessControlEngine &) = delete;

        common::Status Protect(const std::string &ip);
        common::Status Unprotect(const std::string &ip);
        common::Status Cut(const std::string &ip);
        common::Status StopCut(const std::string &ip);

        // Stops every worker; active cuts get their corrective pair.
        void StopAll();

        ControlState State(const std::string &ip) const;
        std::map<std::string, ControlState> States() const;

    private:
        struct Binding
        {
            std::string ip;
            std::string deviceMac;
            std::string localMac;
            common::GatewayInfo gateway;
        };

        struct ControlTask
        {
            ControlState mode = ControlState::Idle;
            Binding binding;
            std::atomic<bool> active{true};
            std::thread thread;
        };

        common::Result<Binding> Bind(const std::string &ip);
        common::Status Start(ControlState mode, const Binding &binding);
        std::unique_ptr<ControlTask> Detach(const std::string &ip);
        void Join(ControlTask &task);

        void RunLoop(ControlTask *task);
        bool SendPair(const Binding &binding, bool truthful);
        void Restore(const Binding &binding);
        void SleepInterval(const ControlTask &task, std::chrono::milliseconds interval);

        DeviceRegistry &m_registry;
        GatewayResolver &m_gateway;
        ArpTransport &m_transport;
        std::string m_interface;
        std::chrono::milliseconds m_protectInterval;
        std::chrono::milliseconds m_cutInterval;

        // Serializes control operations; never taken by workers.
        std::mutex m_opMutex;
        mutable std::mutex m_mutex;
        std::map<std::string, std::unique_ptr<ControlTask>> m_tasks;
    };
}
