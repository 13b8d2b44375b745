#include <gtest/gtest.h>

#include "metadata_probe.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using cephdu::FilesystemKind;
using cephdu::test::FakeAttributeSource;

TEST(MetadataProbe, ClassifiesFilesystemMagic)
{
    EXPECT_EQ(cephdu::classifyFilesystemMagic(cephdu::kCephSuperMagic), FilesystemKind::Ceph);
    EXPECT_EQ(cephdu::classifyFilesystemMagic(cephdu::kFuseSuperMagic), FilesystemKind::CephFuse);
    EXPECT_EQ(cephdu::classifyFilesystemMagic(0xEF53), FilesystemKind::Generic);

    EXPECT_TRUE(cephdu::supportsRecursiveAccounting(FilesystemKind::Ceph));
    EXPECT_TRUE(cephdu::supportsRecursiveAccounting(FilesystemKind::CephFuse));
    EXPECT_FALSE(cephdu::supportsRecursiveAccounting(FilesystemKind::Generic));
    EXPECT_FALSE(cephdu::supportsRecursiveAccounting(FilesystemKind::Unknown));
    EXPECT_STREQ(cephdu::filesystemKindName(FilesystemKind::CephFuse), "ceph-fuse");
}

TEST(MetadataProbe, ReportsUnknownWhenStatfsFails)
{
    auto source = std::make_shared<FakeAttributeSource>(std::nullopt);
    cephdu::MetadataProbe probe(source);
    EXPECT_EQ(probe.filesystemKind("/anywhere"), FilesystemKind::Unknown);
}

TEST(MetadataProbe, ParsesAttributeText)
{
    EXPECT_EQ(cephdu::parseUnsignedAttribute("42"), 42u);
    EXPECT_EQ(cephdu::parseUnsignedAttribute(std::string("17\0", 3)), 17u);
    EXPECT_EQ(cephdu::parseUnsignedAttribute(" 9\n"), 9u);
    EXPECT_FALSE(cephdu::parseUnsignedAttribute("").has_value());
    EXPECT_FALSE(cephdu::parseUnsignedAttribute("-3").has_value());
    EXPECT_FALSE(cephdu::parseUnsignedAttribute("12abc").has_value());

    EXPECT_EQ(cephdu::parseChangeTimeAttribute("1700000000.090000000"), 1700000000u);
    EXPECT_EQ(cephdu::parseChangeTimeAttribute("1700000000"), 1700000000u);
    EXPECT_FALSE(cephdu::parseChangeTimeAttribute(".5").has_value());
}

TEST(MetadataProbe, EntryCountExcludesTheDirectoryItself)
{
    auto source = std::make_shared<FakeAttributeSource>();
    source->set("/ceph/a", "ceph.dir.rentries", "11");
    source->set("/ceph/empty", "ceph.dir.rentries", "0");
    source->set("/ceph/bad", "ceph.dir.rentries", "lots");
    cephdu::MetadataProbe probe(source);

    EXPECT_EQ(probe.recursiveEntryCount("/ceph/a"), 10u);
    EXPECT_EQ(probe.recursiveEntryCount("/ceph/empty"), 0u);
    EXPECT_FALSE(probe.recursiveEntryCount("/ceph/bad").has_value());
    EXPECT_FALSE(probe.recursiveEntryCount("/ceph/missing").has_value());
}

TEST(MetadataProbe, ReadsBytesAndChangeTime)
{
    auto source = std::make_shared<FakeAttributeSource>();
    source->set("/ceph/a", "ceph.dir.rbytes", "123456789");
    source->set("/ceph/a", "ceph.dir.rctime", "1650000000.5");
    cephdu::MetadataProbe probe(source);

    EXPECT_EQ(probe.recursiveByteSize("/ceph/a"), 123456789u);
    EXPECT_EQ(probe.recursiveChangeTime("/ceph/a"), 1650000000u);
    EXPECT_FALSE(probe.recursiveByteSize("/ceph/b").has_value());
}

TEST(MetadataProbe, UsesConfiguredAttributeNames)
{
    auto source = std::make_shared<FakeAttributeSource>();
    source->set("/mnt/x", "user.rentries", "5");
    cephdu::RecursiveAttributeNames names;
    names.entries = "user.rentries";
    cephdu::MetadataProbe probe(source, names);

    EXPECT_EQ(probe.attributeNames().entries, "user.rentries");
    EXPECT_EQ(probe.recursiveEntryCount("/mnt/x"), 4u);
}

TEST(IdentityCache, CachesLookupsAndFallsBackToNumbers)
{
    int userCalls = 0;
    cephdu::IdentityCache cache(
        [&userCalls](std::uint32_t uid) -> std::optional<std::string> {
            ++userCalls;
            if (uid == 1000)
                return std::string("alice");
            return std::nullopt;
        },
        [](std::uint32_t gid) -> std::optional<std::string> {
            if (gid == 100)
                return std::string("users");
            return std::nullopt;
        });

    EXPECT_EQ(cache.userName(1000), "alice");
    EXPECT_EQ(cache.userName(1000), "alice");
    EXPECT_EQ(userCalls, 1);
    EXPECT_EQ(cache.userName(4242), "4242");
    EXPECT_EQ(cache.cachedUsers(), 2u);

    EXPECT_EQ(cache.groupName(100), "users");
    EXPECT_EQ(cache.groupName(1000), "1000");
    EXPECT_EQ(cache.cachedGroups(), 2u);
}

TEST(IdentityCache, SlowLookupDoesNotBlockOtherReaders)
{
    std::promise<void> groupResolved;
    std::future<void> groupDone = groupResolved.get_future();
    std::atomic<bool> overlapped{false};
    std::thread reader;

    cephdu::IdentityCache *cachePtr = nullptr;
    cephdu::IdentityCache cache(
        [&](std::uint32_t) -> std::optional<std::string> {
            reader = std::thread([&]() {
                cachePtr->groupName(100);
                groupResolved.set_value();
            });
            overlapped = groupDone.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
            return std::string("alice");
        },
        [](std::uint32_t) -> std::optional<std::string> { return std::string("users"); });
    cachePtr = &cache;

    EXPECT_EQ(cache.userName(1000), "alice");
    reader.join();
    EXPECT_TRUE(overlapped);
    EXPECT_EQ(cache.groupName(100), "users");
    EXPECT_EQ(cache.cachedUsers(), 1u);
    EXPECT_EQ(cache.cachedGroups(), 1u);
}

TEST(IdentityCache, ResolvesRootThroughTheSystemDatabase)
{
    EXPECT_EQ(cephdu::lookupUserName(0), "root");
    EXPECT_TRUE(cephdu::lookupGroupName(0).has_value());
}
