#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "DeviceRegistry.hpp"
#include "../platform/PlatformAdapter.hpp"

namespace lanwatch::engine
{
    // Approximation only: the aggregate interface rate is split evenly across
    // active devices with +/-10% jitter. There is no per-device metering.
    class BandwidthEstimator
    {
    public:
        static constexpr double JITTER = 0.10;

        explicit BandwidthEstimator(platform::PlatformAdapter &platform, std::uint32_t seed = std::random_device{}());

        void Update(DeviceRegistry &registry);
        void Update(DeviceRegistry &registry, std::chrono::steady_clock::time_point now);

        double LastAggregateMbps() const;

        static bool IsLoopbackName(const std::string &name);

    private:
        platform::PlatformAdapter &m_platform;

        mutable std::mutex m_mutex;
        std::mt19937 m_rng;
        std::optional<std::uint64_t> m_lastTotal;
        std::chrono::steady_clock::time_point m_lastSample{};
        double m_lastAggregate = 0.0;
    };
}
