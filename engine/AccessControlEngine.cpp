#include "AccessControlEngine.hpp"
#include "../common/Address.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>
#include <utility>
#include <vector>

namespace lanwatch::engine
{
    using common::ErrorCode;
    using common::Status;

    const char *ToString(ControlState state)
    {
        switch (state)
        {
        case ControlState::Idle:
            return "idle";
        case ControlState::Protecting:
            return "protecting";
        case ControlState::Cutting:
            return "cutting";
        }
        return "idle";
    }

    AccessControlEngine::AccessControlEngine(DeviceRegistry &registry,
                                             GatewayResolver &gateway,
                                             ArpTransport &transport,
                                             std::string interfaceName,
                                             std::chrono::milliseconds protectInterval,
                                             std::chrono::milliseconds cutInterval)
        : m_registry(registry),
          m_gateway(gateway),
          m_transport(transport),
          m_interface(std::move(interfaceName)),
          m_protectInterval(protectInterval),
          m_cutInterval(cutInterval)
    {
    }

    AccessControlEngine::~AccessControlEngine()
    {
        StopAll();
    }

    ControlState AccessControlEngine::State(const std::string &ip) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_tasks.find(ip);
        if (it == m_tasks.end())
            return ControlState::Idle;
        return it->second->mode;
    }

    std::map<std::string, ControlState> AccessControlEngine::States() const
    {
        std::map<std::string, ControlState> states;
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &[ip, task] : m_tasks)
            states[ip] = task->mode;
        return states;
    }

    common::Result<AccessControlEngine::Binding> AccessControlEngine::Bind(const std::string &ip)
    {
        using R = common::Result<Binding>;

        auto device = m_registry.Get(ip);
        if (!device)
            return R::Fail(ErrorCode::NotFound, "unknown device " + ip);

        auto gateway = m_gateway.Resolve();
        if (!gateway)
            return R::Fail(ErrorCode::Resolution, "gateway could not be resolved");
        if (gateway->ip == ip)
            return R::Fail(ErrorCode::InvalidArgument, ip + " is the gateway");

        Binding binding;
        binding.ip = ip;
        binding.gateway = *gateway;

        if (common::IsUsableMac(device->mac))
        {
            binding.deviceMac = device->mac;
        }
        else
        {
            auto mac = m_transport.Resolve(m_interface, ip);
            if (!mac || !common::IsUsableMac(*mac))
                return R::Fail(ErrorCode::Resolution, "no link-layer address for " + ip);
            binding.deviceMac = *mac;
        }

        auto local = m_transport.LocalMac(m_interface);
        if (!local)
            return R::Fail(ErrorCode::Resolution, "no link-layer address for " + m_interface);
        binding.localMac = *local;

        return R::Ok(binding);
    }

    Status AccessControlEngine::Start(ControlState mode, const Binding &binding)
    {
        auto task = std::make_unique<ControlTask>();
        task->mode = mode;
        task->binding = binding;
        ControlTask *raw = task.get();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_tasks[binding.ip] = std::move(task);
        }

        try
        {
            raw->thread = std::thread(&AccessControlEngine::RunLoop, this, raw);
        }
        catch (const std::system_error &e)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_tasks.erase(binding.ip);
            return Status::Fail(ErrorCode::InvalidState, std::string("cannot start worker: ") + e.what());
        }

        std::cout << "[AccessControl] " << ToString(mode) << " " << binding.ip << "\n";
        return Status::Ok();
    }

    std::unique_ptr<AccessControlEngine::ControlTask> AccessControlEngine::Detach(const std::string &ip)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_tasks.find(ip);
        if (it == m_tasks.end())
            return nullptr;
        std::unique_ptr<ControlTask> task = std::move(it->second);
        m_tasks.erase(it);
        return task;
    }

    void AccessControlEngine::Join(ControlTask &task)
    {
        task.active = false;
        if (task.thread.joinable())
            task.thread.join();
    }

    Status AccessControlEngine::Protect(const std::string &ip)
    {
        std::lock_guard<std::mutex> op(m_opMutex);

        ControlState current = State(ip);
        if (current == ControlState::Protecting)
            return Status::Ok();

        auto bound = Bind(ip);
        if (!bound)
            return Status::Fail(bound.code, bound.error);

        if (current == ControlState::Cutting)
        {
            auto task = Detach(ip);
            if (task)
            {
                Join(*task);
                Restore(task->binding);
            }
        }

        Status started = Start(ControlState::Protecting, *bound.data);
        m_registry.Update(ip, [&started](common::Device &d)
                          {
                              d.attackStatus = common::AttackStatus::None;
                              d.isProtected = started.success;
                          });
        return started;
    }

    Status AccessControlEngine::Unprotect(const std::string &ip)
    {
        std::lock_guard<std::mutex> op(m_opMutex);

        if (State(ip) != ControlState::Protecting)
            return Status::Fail(ErrorCode::InvalidState, ip + " is not protected");

        auto task = Detach(ip);
        if (task)
            Join(*task);

        m_registry.Update(ip, [](common::Device &d)
                          { d.isProtected = false; });
        std::cout << "[AccessControl] Protection of " << ip << " stopped\n";
        return Status::Ok();
    }

    Status AccessControlEngine::Cut(const std::string &ip)
    {
        std::lock_guard<std::mutex> op(m_opMutex);

        ControlState current = State(ip);
        if (current == ControlState::Protecting)
            return Status::Fail(ErrorCode::InvalidState, ip + " is protected");
        if (current == ControlState::Cutting)
            return Status::Ok();

        auto bound = Bind(ip);
        if (!bound)
            return Status::Fail(bound.code, bound.error);

        Status started = Start(ControlState::Cutting, *bound.data);
        if (started)
        {
            m_registry.Update(ip, [](common::Device &d)
                              {
                                  d.isProtected = false;
                                  d.attackStatus = common::AttackStatus::Cutting;
                              });
        }
        return started;
    }

    Status AccessControlEngine::StopCut(const std::string &ip)
    {
        std::lock_guard<std::mutex> op(m_opMutex);

        if (State(ip) != ControlState::Cutting)
            return Status::Fail(ErrorCode::InvalidState, ip + " is not being cut");

        auto task = Detach(ip);
        m_registry.Update(ip, [](common::Device &d)
                          { d.attackStatus = common::AttackStatus::None; });
        if (task)
        {
            Join(*task);
            Restore(task->binding);
        }
        std::cout << "[AccessControl] Cut of " << ip << " stopped\n";
        return Status::Ok();
    }

    void AccessControlEngine::StopAll()
    {
        std::lock_guard<std::mutex> op(m_opMutex);

        std::map<std::string, std::unique_ptr<ControlTask>> tasks;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            tasks.swap(m_tasks);
        }

        for (auto &[ip, task] : tasks)
            task->active = false;

        for (auto &[ip, task] : tasks)
        {
            Join(*task);
            if (task->mode == ControlState::Cutting)
                Restore(task->binding);

            m_registry.Update(ip, [](common::Device &d)
                              {
                                  d.isProtected = false;
                                  d.attackStatus = common::AttackStatus::None;
                              });
        }
    }

    bool AccessControlEngine::SendPair(const Binding &binding, bool truthful)
    {
        const std::string &claimedForGateway = truthful ? binding.gateway.mac : binding.localMac;
        const std::string &claimedForDevice = truthful ? binding.deviceMac : binding.localMac;

        ArpAnnouncement toDevice{binding.ip, binding.deviceMac, binding.gateway.ip, claimedForGateway};
        ArpAnnouncement toGateway{binding.gateway.ip, binding.gateway.mac, binding.ip, claimedForDevice};

        bool ok = true;
        for (const auto &announcement : {toDevice, toGateway})
        {
            try
            {
                ok = m_transport.Announce(m_interface, announcement) && ok;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[AccessControl] Announcement to " << announcement.targetIp << " failed: " << e.what() << "\n";
                ok = false;
            }
        }
        return ok;
    }

    void AccessControlEngine::Restore(const Binding &binding)
    {
        if (!SendPair(binding, true))
            std::cerr << "[AccessControl] Could not restore mapping for " << binding.ip << "\n";
    }

    void AccessControlEngine::SleepInterval(const ControlTask &task, std::chrono::milliseconds interval)
    {
        const auto step = std::min(interval, std::chrono::milliseconds(100));
        auto slept = std::chrono::milliseconds(0);

        while (slept < interval)
        {
            if (!task.active)
                return;
            std::this_thread::sleep_for(step);
            slept += step;
        }
    }

    void AccessControlEngine::RunLoop(ControlTask *task)
    {
        const bool truthful = task->mode == ControlState::Protecting;
        const auto interval = truthful ? m_protectInterval : m_cutInterval;
        int failures = 0;

        while (task->active)
        {
            if (SendPair(task->binding, truthful))
            {
                failures = 0;
            }
            else if (++failures >= MAX_SEND_FAILURES)
            {
                std::cerr << "[AccessControl] " << failures << " consecutive send failures for "
                          << task->binding.ip << ", invalidating gateway\n";
                m_gateway.Invalidate();
                failures = 0;
            }

            SleepInterval(*task, interval);
        }
    }
}
