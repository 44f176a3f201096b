#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "BandwidthEstimator.hpp"
#include "DeviceRegistry.hpp"
#include "DiscoveryEngine.hpp"

namespace lanwatch::engine
{
    // discover -> apply -> estimate, on a fixed interval.
    class MonitorScheduler
    {
    public:
        MonitorScheduler(DiscoveryEngine &discovery,
                         DeviceRegistry &registry,
                         BandwidthEstimator &bandwidth,
                         std::string interfaceName,
                         std::chrono::milliseconds interval = std::chrono::seconds(5));
        ~MonitorScheduler();

        void Start();
        // Blocks until the loop has finished its current iteration.
        void Stop();
        bool IsRunning() const { return m_running; }

        // One synchronous cycle. Returns false if the cycle threw.
        bool RunOnce();

        std::size_t CompletedCycles() const { return m_cycles; }

    private:
        void MonitorLoop();

        DiscoveryEngine &m_discovery;
        DeviceRegistry &m_registry;
        BandwidthEstimator &m_bandwidth;
        std::string m_interface;
        std::chrono::milliseconds m_interval;

        std::atomic<bool> m_running{false};
        std::atomic<std::size_t> m_cycles{0};
        std::thread m_thread;
        std::mutex m_lifecycleMutex;
        std::mutex m_waitMutex;
        std::condition_variable m_wake;
    };
}
