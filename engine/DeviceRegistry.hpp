#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "../common/Device.hpp"

namespace lanwatch::engine
{
    struct DeviceFilter
    {
        std::optional<std::string> interfaceName;
        std::optional<common::DeviceStatus> status;
    };

    // Owns every Device record. All access goes through the lock; readers get copies.
    class DeviceRegistry
    {
    public:
        using Mutator = std::function<void(common::Device &)>;

        explicit DeviceRegistry(std::chrono::milliseconds stalenessWindow = std::chrono::minutes(2));

        // Merges one discovery pass and ages every device the pass did not see.
        void Apply(const std::vector<common::DeviceObservation> &observations, common::Clock::time_point now);

        std::optional<common::Device> Get(const std::string &ip) const;

        // Sorted by address.
        std::vector<common::Device> List(const DeviceFilter &filter = {}) const;

        // Runs `mutator` on the record under the write lock. False if the ip is unknown.
        bool Update(const std::string &ip, const Mutator &mutator);
        void UpdateAll(const Mutator &mutator);

        std::size_t Size() const;
        std::chrono::milliseconds StalenessWindow() const { return m_stalenessWindow; }

    private:
        std::chrono::milliseconds m_stalenessWindow;

        mutable std::shared_mutex m_mutex;
        std::map<std::string, common::Device> m_devices;
    };
}
