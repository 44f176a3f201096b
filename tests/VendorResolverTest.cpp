#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "Fakes.hpp"
#include "../engine/MacVendorsClient.hpp"
#include "../engine/VendorResolver.hpp"

using namespace lanwatch;
using engine::VendorResolver;
using test::FakeVendorLookup;

TEST(VendorResolverTest, StaticTableNeedsNoRemote)
{
    FakeVendorLookup remote;
    VendorResolver resolver(&remote);

    EXPECT_EQ(resolver.Resolve("b8:27:eb:01:02:03"), "Raspberry Pi Foundation");
    EXPECT_EQ(resolver.Resolve("08-00-27-aa-bb-cc"), "Oracle VirtualBox");
    EXPECT_EQ(remote.calls.load(), 0);
    EXPECT_EQ(resolver.RemoteLookups(), 0u);
}

TEST(VendorResolverTest, RemoteResultIsCached)
{
    FakeVendorLookup remote;
    remote.vendors["AABBCC"] = "Acme Networks";
    VendorResolver resolver(&remote);

    EXPECT_EQ(resolver.Resolve("AA:BB:CC:11:22:33"), "Acme Networks");
    EXPECT_EQ(resolver.Resolve("AA:BB:CC:44:55:66"), "Acme Networks");
    EXPECT_EQ(remote.calls.load(), 1);
    EXPECT_EQ(resolver.CacheSize(), 1u);
}

TEST(VendorResolverTest, ConcurrentCallersShareOneLookup)
{
    FakeVendorLookup remote;
    remote.vendors["AABBCC"] = "Acme Networks";
    VendorResolver resolver(&remote);

    std::vector<std::thread> threads;
    std::vector<std::optional<std::string>> results(8);
    for (std::size_t i = 0; i < results.size(); ++i)
    {
        threads.emplace_back([&resolver, &results, i]
                             { results[i] = resolver.Resolve("AA:BB:CC:00:00:0" + std::to_string(i)); });
    }
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(remote.calls.load(), 1);
    for (const auto &r : results)
        EXPECT_EQ(r, "Acme Networks");
}

TEST(VendorResolverTest, UnknownPrefixIsCachedAsAbsent)
{
    FakeVendorLookup remote;
    VendorResolver resolver(&remote);

    EXPECT_FALSE(resolver.Resolve("AA:BB:CC:11:22:33"));
    EXPECT_FALSE(resolver.Resolve("AA:BB:CC:11:22:33"));
    EXPECT_EQ(remote.calls.load(), 1);
}

TEST(VendorResolverTest, UnreachableRegistryIsRetriedAfterBackoff)
{
    FakeVendorLookup remote;
    remote.unreachable = true;
    remote.vendors["AABBCC"] = "Acme Networks";
    VendorResolver resolver(&remote, std::chrono::milliseconds(0));

    EXPECT_FALSE(resolver.Resolve("AA:BB:CC:11:22:33"));
    EXPECT_EQ(resolver.CacheSize(), 0u);

    remote.unreachable = false;
    EXPECT_EQ(resolver.Resolve("AA:BB:CC:11:22:33"), "Acme Networks");
    EXPECT_EQ(remote.calls.load(), 2);
    EXPECT_EQ(resolver.CacheSize(), 1u);
}

TEST(VendorResolverTest, FailedPrefixWaitsBeforeRetry)
{
    FakeVendorLookup remote;
    remote.unreachable = true;
    VendorResolver resolver(&remote, std::chrono::hours(1));

    EXPECT_FALSE(resolver.Resolve("AA:BB:CC:11:22:33"));
    EXPECT_FALSE(resolver.Resolve("AA:BB:CC:11:22:33"));
    EXPECT_EQ(remote.calls.load(), 1);

    // Other prefixes are unaffected.
    EXPECT_FALSE(resolver.Resolve("DD:EE:FF:11:22:33"));
    EXPECT_EQ(remote.calls.load(), 2);
}

TEST(VendorResolverTest, UnexpectedErrorDoesNotEscape)
{
    FakeVendorLookup remote;
    remote.garbled = true;
    VendorResolver resolver(&remote, std::chrono::milliseconds(0));

    EXPECT_NO_THROW(EXPECT_FALSE(resolver.Resolve("AA:BB:CC:11:22:33")));
    EXPECT_EQ(resolver.CacheSize(), 0u);
}

TEST(VendorResolverTest, WorksWithoutRemoteAndRejectsBadMacs)
{
    VendorResolver resolver;
    EXPECT_FALSE(resolver.Resolve("AA:BB:CC:11:22:33"));
    EXPECT_FALSE(resolver.Resolve("not a mac"));
    EXPECT_EQ(resolver.StaticVendor("B827EB"), "Raspberry Pi Foundation");
    EXPECT_FALSE(VendorResolver::StaticVendor("AABBCC"));
}

TEST(HttpResponseTest, ParsesStatusAndBody)
{
    auto ok = engine::ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n\r\nRaspberry Pi Trading Ltd");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->status, 200);
    EXPECT_EQ(ok->body, "Raspberry Pi Trading Ltd");

    auto missing = engine::ParseHttpResponse("HTTP/1.0 404 Not Found\r\n\r\n{\"errors\":{\"detail\":\"Not Found\"}}");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);

    auto headersOnly = engine::ParseHttpResponse("HTTP/1.1 429 Too Many Requests\r\nRetry-After: 1\r\n");
    ASSERT_TRUE(headersOnly);
    EXPECT_EQ(headersOnly->status, 429);
    EXPECT_TRUE(headersOnly->body.empty());
}

TEST(HttpResponseTest, RejectsMalformedStatusLine)
{
    EXPECT_FALSE(engine::ParseHttpResponse(""));
    EXPECT_FALSE(engine::ParseHttpResponse("SSH-2.0-OpenSSH_9.6\r\n"));
    EXPECT_FALSE(engine::ParseHttpResponse("HTTP/1.1 abc\r\n\r\n"));
}
