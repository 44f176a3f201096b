#include "MonitorScheduler.hpp"

#include <iostream>
#include <utility>

namespace lanwatch::engine
{
    MonitorScheduler::MonitorScheduler(DiscoveryEngine &discovery,
                                       DeviceRegistry &registry,
                                       BandwidthEstimator &bandwidth,
                                       std::string interfaceName,
                                       std::chrono::milliseconds interval)
        : m_discovery(discovery),
          m_registry(registry),
          m_bandwidth(bandwidth),
          m_interface(std::move(interfaceName)),
          m_interval(interval)
    {
    }

    MonitorScheduler::~MonitorScheduler()
    {
        Stop();
    }

    void MonitorScheduler::Start()
    {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        if (m_running)
            return;
        m_running = true;
        m_thread = std::thread(&MonitorScheduler::MonitorLoop, this);
        std::cout << "[Monitor] Started on " << m_interface << " every " << m_interval.count() << " ms\n";
    }

    void MonitorScheduler::Stop()
    {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        {
            std::lock_guard<std::mutex> wait(m_waitMutex);
            m_running = false;
        }
        m_wake.notify_all();
        if (m_thread.joinable())
        {
            m_thread.join();
            std::cout << "[Monitor] Stopped\n";
        }
    }

    bool MonitorScheduler::RunOnce()
    {
        try
        {
            auto observations = m_discovery.Discover(m_interface);
            m_registry.Apply(observations, common::Clock::now());
            m_bandwidth.Update(m_registry);
            ++m_cycles;
            return true;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Monitor] Cycle failed: " << e.what() << "\n";
            return false;
        }
    }

    void MonitorScheduler::MonitorLoop()
    {
        while (m_running)
        {
            RunOnce();

            std::unique_lock<std::mutex> lock(m_waitMutex);
            m_wake.wait_for(lock, m_interval, [this]
                            { return !m_running; });
        }
    }
}
