#include <gtest/gtest.h>

#include "cephdu_options.hpp"

#include "cephdu/options.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace config = cephdu::config;
using cephdu::SortField;

namespace
{

class EnvGuard
{
public:
    explicit EnvGuard(const char *name)
        : name(name)
    {
        if (const char *value = std::getenv(name))
            previous = value;
    }

    ~EnvGuard()
    {
        if (previous)
            ::setenv(name, previous->c_str(), 1);
        else
            ::unsetenv(name);
    }

private:
    const char *name;
    std::optional<std::string> previous;
};

config::OptionRegistry makeRegistry()
{
    config::OptionRegistry registry("cephdu");
    cephdu::registerCephDuOptions(registry);
    return registry;
}

} // namespace

TEST(CephDuOptions, RegistersDefaults)
{
    config::OptionRegistry registry = makeRegistry();
    EXPECT_TRUE(registry.hasOption(cephdu::kOptionSortField));
    EXPECT_TRUE(registry.hasOption(cephdu::kOptionRctimeAttribute));

    cephdu::CephDuOptions options = cephdu::optionsFromRegistry(registry);
    EXPECT_TRUE(options.defaultPath.empty());
    EXPECT_EQ(options.sortField, SortField::Size);
    EXPECT_FALSE(options.showOwner);
    EXPECT_EQ(options.gaugeWidth, 20);
    EXPECT_EQ(options.pageStep, 10u);
    EXPECT_EQ(options.attributes.entries, "ceph.dir.rentries");
    EXPECT_EQ(options.attributes.bytes, "ceph.dir.rbytes");
    EXPECT_EQ(options.attributes.changeTime, "ceph.dir.rctime");
    EXPECT_EQ(options.logLevel, "warn");
}

TEST(CephDuOptions, ClampsNumericOptions)
{
    config::OptionRegistry registry = makeRegistry();
    registry.set(cephdu::kOptionGaugeWidth, config::OptionValue(std::int64_t{500}));
    registry.set(cephdu::kOptionPageStep, config::OptionValue(std::int64_t{0}));
    cephdu::CephDuOptions options = cephdu::optionsFromRegistry(registry);
    EXPECT_EQ(options.gaugeWidth, cephdu::kMaxGaugeWidth);
    EXPECT_EQ(options.pageStep, 1u);

    registry.set(cephdu::kOptionGaugeWidth, config::OptionValue(std::int64_t{2}));
    EXPECT_EQ(cephdu::optionsFromRegistry(registry).gaugeWidth, cephdu::kMinGaugeWidth);
}

TEST(CephDuOptions, UnknownSortFieldFallsBackToSize)
{
    config::OptionRegistry registry = makeRegistry();
    registry.set(cephdu::kOptionSortField, config::OptionValue("colour"));
    EXPECT_EQ(cephdu::optionsFromRegistry(registry).sortField, SortField::Size);

    registry.set(cephdu::kOptionSortField, config::OptionValue("Owner"));
    EXPECT_EQ(cephdu::optionsFromRegistry(registry).sortField, SortField::Owner);
}

TEST(CephDuOptions, ParsesSortFieldNames)
{
    EXPECT_EQ(cephdu::sortFieldFromString("name"), SortField::Name);
    EXPECT_EQ(cephdu::sortFieldFromString("SIZE"), SortField::Size);
    EXPECT_EQ(cephdu::sortFieldFromString("rentries"), SortField::RecursiveEntryCount);
    EXPECT_EQ(cephdu::sortFieldFromString("count"), SortField::RecursiveEntryCount);
    EXPECT_EQ(cephdu::sortFieldFromString("ctime"), SortField::ChangeTime);
    EXPECT_FALSE(cephdu::sortFieldFromString("mtime").has_value());

    for (SortField field : {SortField::Name, SortField::Size, SortField::RecursiveEntryCount, SortField::Owner,
                            SortField::ChangeTime})
        EXPECT_EQ(cephdu::sortFieldFromString(cephdu::sortFieldName(field)), field);
}

TEST(CephDuOptions, StartupPathPrefersConfiguredDirectory)
{
    cephdu::CephDuOptions options;
    options.defaultPath = "/scratch/project";
    EXPECT_EQ(cephdu::startupPath(options), std::filesystem::path("/scratch/project"));
}

TEST(CephDuOptions, StartupPathDefaultsToUserDirectory)
{
    EnvGuard guard("USER");
    ::setenv("USER", "alice", 1);
    EXPECT_EQ(cephdu::startupPath(cephdu::CephDuOptions{}), std::filesystem::path("/mnt/ceph/users/alice"));
}
