#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "../common/EngineConfig.hpp"

using namespace lanwatch::common;
using namespace std::chrono_literals;

namespace
{
    std::string WriteTempConfig(const std::string &name, const std::string &content)
    {
        std::string path = ::testing::TempDir() + name;
        std::ofstream out(path);
        out << content;
        return path;
    }
}

TEST(EngineConfigTest, DefaultsMatchDocumentedValues)
{
    EngineConfig config;
    EXPECT_EQ(config.scanInterval, 5000ms);
    EXPECT_EQ(config.stalenessWindow, 120000ms);
    EXPECT_EQ(config.protectInterval, 1000ms);
    EXPECT_EQ(config.cutInterval, 1000ms);
    EXPECT_TRUE(config.vendorLookup);
    EXPECT_EQ(config.vendorHost, "api.macvendors.com");
    EXPECT_TRUE(config.interface.empty());
}

TEST(EngineConfigTest, DurationsAcceptSecondsAndMilliseconds)
{
    EngineConfig config;
    EXPECT_TRUE(config.Set("scan_interval", "10"));
    EXPECT_EQ(config.scanInterval, 10000ms);
    EXPECT_TRUE(config.Set("probe_timeout", "250ms"));
    EXPECT_EQ(config.probeTimeout, 250ms);
    EXPECT_TRUE(config.Set("staleness_window", "90s"));
    EXPECT_EQ(config.stalenessWindow, 90000ms);
    EXPECT_TRUE(config.Set("cut_interval", "0.5"));
    EXPECT_EQ(config.cutInterval, 500ms);
}

TEST(EngineConfigTest, RejectsBadValuesWithoutChangingState)
{
    EngineConfig config;
    EXPECT_FALSE(config.Set("scan_interval", "0"));
    EXPECT_FALSE(config.Set("protect_interval", "-1"));
    EXPECT_FALSE(config.Set("probe_timeout", "soon"));
    EXPECT_FALSE(config.Set("vendor_lookup", "maybe"));
    EXPECT_FALSE(config.Set("vendor_host", ""));
    EXPECT_FALSE(config.Set("no_such_key", "1"));

    EXPECT_EQ(config.scanInterval, 5000ms);
    EXPECT_EQ(config.protectInterval, 1000ms);
    EXPECT_TRUE(config.vendorLookup);
}

TEST(EngineConfigTest, RejectsNonFiniteAndHugeDurations)
{
    EngineConfig config;
    EXPECT_FALSE(config.Set("scan_interval", "nan"));
    EXPECT_FALSE(config.Set("scan_interval", "inf"));
    EXPECT_FALSE(config.Set("protect_interval", "1e30"));
    EXPECT_FALSE(config.Set("cut_interval", "-inf"));
    EXPECT_FALSE(config.Set("probe_timeout", "86401"));
    EXPECT_FALSE(config.Set("scan_interval", "0.0001"));

    EXPECT_EQ(config.scanInterval, 5000ms);
    EXPECT_EQ(config.protectInterval, 1000ms);
    EXPECT_EQ(config.cutInterval, 1000ms);
    EXPECT_EQ(config.probeTimeout, 3000ms);

    EXPECT_TRUE(config.Set("staleness_window", "86400"));
    EXPECT_EQ(config.stalenessWindow, std::chrono::milliseconds(EngineConfig::MAX_DURATION));
}

TEST(EngineConfigTest, ZeroTimeoutIsAllowed)
{
    EngineConfig config;
    EXPECT_TRUE(config.Set("hostname_timeout", "0"));
    EXPECT_EQ(config.hostnameTimeout, 0ms);
}

TEST(EngineConfigTest, LoadFileAppliesValidLinesAndSkipsTheRest)
{
    std::string path = WriteTempConfig("lanwatch_config_test.conf",
                                       "# lanwatch\n"
                                       "\n"
                                       "interface = wlan0\n"
                                       "vendor_lookup = off\n"
                                       "scan_interval = 2\n"
                                       "this line is malformed\n"
                                       "cut_interval = 0\n"
                                       "unknown_key = 5\n");

    EngineConfig config;
    ASSERT_TRUE(config.LoadFile(path));
    EXPECT_EQ(config.interface, "wlan0");
    EXPECT_FALSE(config.vendorLookup);
    EXPECT_EQ(config.scanInterval, 2000ms);
    EXPECT_EQ(config.cutInterval, 1000ms);

    std::remove(path.c_str());
}

TEST(EngineConfigTest, LoadFileFailsForMissingFile)
{
    EngineConfig config;
    EXPECT_FALSE(config.LoadFile(::testing::TempDir() + "lanwatch_does_not_exist.conf"));
}

TEST(EngineConfigTest, ReadConfigLinesTrimsAndDropsComments)
{
    std::string path = WriteTempConfig("lanwatch_lines_test.conf", "  a = 1  \n# b = 2\n\t\nc=3\n");
    bool opened = false;
    auto lines = ReadConfigLines(path, &opened);
    EXPECT_TRUE(opened);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "a = 1");
    EXPECT_EQ(lines[1], "c=3");
    std::remove(path.c_str());
}
