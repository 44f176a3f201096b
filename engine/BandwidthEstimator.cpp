#include "BandwidthEstimator.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace lanwatch::engine
{
    BandwidthEstimator::BandwidthEstimator(platform::PlatformAdapter &platform, std::uint32_t seed)
        : m_platform(platform), m_rng(seed)
    {
    }

    bool BandwidthEstimator::IsLoopbackName(const std::string &name)
    {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (lower.find("loopback") != std::string::npos)
            return true;
        if (lower.compare(0, 2, "lo") != 0)
            return false;
        return lower.size() == 2 || std::isdigit(static_cast<unsigned char>(lower[2]));
    }

    double BandwidthEstimator::LastAggregateMbps() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastAggregate;
    }

    void BandwidthEstimator::Update(DeviceRegistry &registry)
    {
        Update(registry, std::chrono::steady_clock::now());
    }

    void BandwidthEstimator::Update(DeviceRegistry &registry, std::chrono::steady_clock::time_point now)
    {
        std::uint64_t total = 0;
        try
        {
            for (const auto &counter : m_platform.ReadInterfaceCounters())
            {
                if (!IsLoopbackName(counter.name))
                    total += counter.rxBytes + counter.txBytes;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Bandwidth] Counter read failed: " << e.what() << "\n";
            return;
        }

        std::lock_guard<std::mutex> lock(m_mutex);

        double aggregate = 0.0;
        if (m_lastTotal && total >= *m_lastTotal)
        {
            double seconds = std::chrono::duration<double>(now - m_lastSample).count();
            if (seconds > 0.0)
                aggregate = static_cast<double>(total - *m_lastTotal) * 8.0 / seconds / 1e6;
        }
        m_lastTotal = total;
        m_lastSample = now;
        m_lastAggregate = aggregate;

        std::size_t active = registry.List(DeviceFilter{std::nullopt, common::DeviceStatus::Active}).size();
        const double share = active > 0 ? aggregate / static_cast<double>(active) : 0.0;
        std::uniform_real_distribution<double> jitter(-JITTER, JITTER);

        registry.UpdateAll([&](common::Device &d)
                           {
                               if (d.status != common::DeviceStatus::Active)
                               {
                                   d.currentSpeedMbps = 0.0;
                                   return;
                               }
                               double speed = std::max(0.0, share * (1.0 + jitter(m_rng)));
                               if (d.speedLimitMbps)
                                   speed = std::min(speed, std::max(0.0, *d.speedLimitMbps));
                               d.currentSpeedMbps = speed;
                           });
    }
}
