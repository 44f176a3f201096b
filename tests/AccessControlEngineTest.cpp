#include <gtest/gtest.h>

#include "Fakes.hpp"
#include "../engine/AccessControlEngine.hpp"

using namespace lanwatch;
using namespace std::chrono_literals;
using common::AttackStatus;
using common::ErrorCode;
using engine::AccessControlEngine;
using engine::ControlState;

namespace
{
    const std::string kDeviceIp = "192.168.1.50";
    const std::string kDeviceMac = "B8:27:EB:01:02:03";
    const std::string kGatewayIp = "192.168.1.1";
    const std::string kGatewayMac = "A4:2B:B0:11:22:33";
    const std::string kLocalMac = "02:00:00:00:00:01";

    class AccessControlEngineTest : public ::testing::Test
    {
    protected:
        AccessControlEngineTest()
            : gateway(platform, transport, "eth0"),
              access(registry, gateway, transport, "eth0", 20ms, 20ms)
        {
            platform.gateway = kGatewayIp;
            platform.neighbors = {{kGatewayIp, kGatewayMac, "eth0"}};
            registry.Apply({test::MakeObservation(kDeviceIp, kDeviceMac)}, common::Clock::now());
        }

        common::Device Device(const std::string &ip = kDeviceIp) const
        {
            return *registry.Get(ip);
        }

        bool WaitForAnnouncements(std::size_t count)
        {
            return test::WaitFor([this, count]
                                 { return transport.Sent().size() >= count; });
        }

        test::FakePlatformAdapter platform;
        test::FakeArpTransport transport;
        engine::DeviceRegistry registry;
        engine::GatewayResolver gateway;
        AccessControlEngine access;
    };
}

TEST_F(AccessControlEngineTest, ProtectSendsTruthfulPairs)
{
    ASSERT_TRUE(access.Protect(kDeviceIp));
    EXPECT_EQ(access.State(kDeviceIp), ControlState::Protecting);
    EXPECT_TRUE(Device().isProtected);
    EXPECT_EQ(Device().attackStatus, AttackStatus::None);

    ASSERT_TRUE(WaitForAnnouncements(2));
    auto sent = transport.Sent();
    EXPECT_EQ(sent[0].targetIp, kDeviceIp);
    EXPECT_EQ(sent[0].targetMac, kDeviceMac);
    EXPECT_EQ(sent[0].senderIp, kGatewayIp);
    EXPECT_EQ(sent[0].senderMac, kGatewayMac);
    EXPECT_EQ(sent[1].targetIp, kGatewayIp);
    EXPECT_EQ(sent[1].targetMac, kGatewayMac);
    EXPECT_EQ(sent[1].senderIp, kDeviceIp);
    EXPECT_EQ(sent[1].senderMac, kDeviceMac);

    ASSERT_TRUE(access.Unprotect(kDeviceIp));
    EXPECT_EQ(access.State(kDeviceIp), ControlState::Idle);
    EXPECT_FALSE(Device().isProtected);
}

TEST_F(AccessControlEngineTest, ProtectIsIdempotent)
{
    ASSERT_TRUE(access.Protect(kDeviceIp));
    ASSERT_TRUE(access.Protect(kDeviceIp));
    EXPECT_EQ(access.States().size(), 1u);
}

TEST_F(AccessControlEngineTest, CutOnProtectedDeviceIsRefused)
{
    ASSERT_TRUE(access.Protect(kDeviceIp));

    auto result = access.Cut(kDeviceIp);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.code, ErrorCode::InvalidState);
    EXPECT_EQ(access.State(kDeviceIp), ControlState::Protecting);
    EXPECT_TRUE(Device().isProtected);
    EXPECT_EQ(Device().attackStatus, AttackStatus::None);
}

TEST_F(AccessControlEngineTest, CutSpoofsThenRestoreSendsCorrectivePair)
{
    ASSERT_TRUE(access.Cut(kDeviceIp));
    EXPECT_EQ(access.State(kDeviceIp), ControlState::Cutting);
    EXPECT_EQ(Device().attackStatus, AttackStatus::Cutting);
    EXPECT_FALSE(Device().isProtected);

    ASSERT_TRUE(WaitForAnnouncements(2));
    auto spoofed = transport.Sent();
    EXPECT_EQ(spoofed[0].senderIp, kGatewayIp);
    EXPECT_EQ(spoofed[0].senderMac, kLocalMac);
    EXPECT_EQ(spoofed[1].senderIp, kDeviceIp);
    EXPECT_EQ(spoofed[1].senderMac, kLocalMac);

    ASSERT_TRUE(access.StopCut(kDeviceIp));
    EXPECT_EQ(access.State(kDeviceIp), ControlState::Idle);
    EXPECT_EQ(Device().attackStatus, AttackStatus::None);

    auto sent = transport.Sent();
    ASSERT_GE(sent.size(), 4u);
    const auto &toDevice = sent[sent.size() - 2];
    const auto &toGateway = sent[sent.size() - 1];
    EXPECT_EQ(toDevice.targetIp, kDeviceIp);
    EXPECT_EQ(toDevice.senderMac, kGatewayMac);
    EXPECT_EQ(toGateway.targetIp, kGatewayIp);
    EXPECT_EQ(toGateway.senderMac, kDeviceMac);

    // The worker is gone: nothing more is sent.
    std::size_t settled = transport.Sent().size();
    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(transport.Sent().size(), settled);
}

TEST_F(AccessControlEngineTest, ProtectTakesOverFromCut)
{
    ASSERT_TRUE(access.Cut(kDeviceIp));
    ASSERT_TRUE(access.Protect(kDeviceIp));

    EXPECT_EQ(access.State(kDeviceIp), ControlState::Protecting);
    EXPECT_TRUE(Device().isProtected);
    EXPECT_EQ(Device().attackStatus, AttackStatus::None);
}

TEST_F(AccessControlEngineTest, NeverProtectedAndCuttingAtOnce)
{
    auto check = [this]
    {
        auto d = Device();
        EXPECT_FALSE(d.isProtected && d.attackStatus == AttackStatus::Cutting);
    };

    access.Cut(kDeviceIp);
    check();
    access.Protect(kDeviceIp);
    check();
    access.Cut(kDeviceIp);
    check();
    access.Unprotect(kDeviceIp);
    check();
    access.Cut(kDeviceIp);
    check();
    access.StopAll();
    check();
}

TEST_F(AccessControlEngineTest, StoppingWhatIsNotRunningIsInvalidState)
{
    EXPECT_EQ(access.Unprotect(kDeviceIp).code, ErrorCode::InvalidState);
    EXPECT_EQ(access.StopCut(kDeviceIp).code, ErrorCode::InvalidState);

    ASSERT_TRUE(access.Protect(kDeviceIp));
    EXPECT_EQ(access.StopCut(kDeviceIp).code, ErrorCode::InvalidState);
}

TEST_F(AccessControlEngineTest, UnresolvedGatewayChangesNothing)
{
    platform.gateway.reset();

    auto protect = access.Protect(kDeviceIp);
    EXPECT_EQ(protect.code, ErrorCode::Resolution);
    auto cut = access.Cut(kDeviceIp);
    EXPECT_EQ(cut.code, ErrorCode::Resolution);

    EXPECT_EQ(access.State(kDeviceIp), ControlState::Idle);
    EXPECT_FALSE(Device().isProtected);
    EXPECT_EQ(Device().attackStatus, AttackStatus::None);
    EXPECT_TRUE(transport.Sent().empty());
}

TEST_F(AccessControlEngineTest, DeviceWithoutLinkAddressIsUnresolvable)
{
    registry.Update(kDeviceIp, [](common::Device &d)
                    { d.mac.clear(); });

    EXPECT_EQ(access.Cut(kDeviceIp).code, ErrorCode::Resolution);
    EXPECT_EQ(transport.resolveCalls.load(), 1);

    transport.resolvable[kDeviceIp] = kDeviceMac;
    EXPECT_TRUE(access.Cut(kDeviceIp));
}

TEST_F(AccessControlEngineTest, MissingLocalAddressIsUnresolvable)
{
    transport.localMac.reset();
    EXPECT_EQ(access.Protect(kDeviceIp).code, ErrorCode::Resolution);
}

TEST_F(AccessControlEngineTest, GatewayAndUnknownDevicesAreRejected)
{
    registry.Apply({test::MakeObservation(kGatewayIp, kGatewayMac)}, common::Clock::now());
    EXPECT_EQ(access.Cut(kGatewayIp).code, ErrorCode::InvalidArgument);
    EXPECT_EQ(access.Protect("192.168.1.99").code, ErrorCode::NotFound);
}

TEST_F(AccessControlEngineTest, RepeatedSendFailuresInvalidateGateway)
{
    transport.announceOk = false;
    ASSERT_TRUE(access.Cut(kDeviceIp));
    ASSERT_TRUE(gateway.Cached());

    // Five failed pairs at 20 ms apiece.
    EXPECT_TRUE(test::WaitFor([this]
                              { return !gateway.Cached(); }));
    EXPECT_EQ(access.State(kDeviceIp), ControlState::Cutting);
}

TEST_F(AccessControlEngineTest, StopAllRestoresEveryCut)
{
    registry.Apply({test::MakeObservation("192.168.1.60", "B8:27:EB:0A:0B:0C")}, common::Clock::now());
    ASSERT_TRUE(access.Cut(kDeviceIp));
    ASSERT_TRUE(access.Cut("192.168.1.60"));
    ASSERT_TRUE(WaitForAnnouncements(4));

    access.StopAll();
    EXPECT_TRUE(access.States().empty());
    EXPECT_EQ(Device().attackStatus, AttackStatus::None);
    EXPECT_EQ(Device("192.168.1.60").attackStatus, AttackStatus::None);

    int corrective = 0;
    for (const auto &a : transport.Sent())
    {
        if (a.targetIp == kGatewayIp && (a.senderMac == kDeviceMac || a.senderMac == "B8:27:EB:0A:0B:0C"))
            ++corrective;
    }
    EXPECT_EQ(corrective, 2);
}

TEST(ControlStateTest, Names)
{
    EXPECT_STREQ(engine::ToString(ControlState::Idle), "idle");
    EXPECT_STREQ(engine::ToString(ControlState::Protecting), "protecting");
    EXPECT_STREQ(engine::ToString(ControlState::Cutting), "cutting");
}
