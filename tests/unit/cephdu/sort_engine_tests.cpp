#include <gtest/gtest.h>

#include "sort_engine.hpp"

#include <optional>
#include <string>
#include <vector>

using cephdu::DirEntry;
using cephdu::SortField;
using cephdu::SortMode;

namespace
{

DirEntry entry(std::string name, std::optional<std::uint64_t> size, std::optional<std::uint64_t> rentries = {})
{
    DirEntry e;
    e.name = std::move(name);
    e.size = size;
    e.rentries = rentries;
    return e;
}

std::vector<std::string> names(const std::vector<DirEntry> &entries)
{
    std::vector<std::string> result;
    for (const DirEntry &e : entries)
        result.push_back(e.name);
    return result;
}

} // namespace

TEST(SortEngine, DefaultDirections)
{
    EXPECT_EQ(cephdu::defaultSortMode(SortField::Name), (SortMode{SortField::Name, false}));
    EXPECT_EQ(cephdu::defaultSortMode(SortField::Owner), (SortMode{SortField::Owner, false}));
    EXPECT_EQ(cephdu::defaultSortMode(SortField::Size), (SortMode{SortField::Size, true}));
    EXPECT_EQ(cephdu::defaultSortMode(SortField::RecursiveEntryCount),
              (SortMode{SortField::RecursiveEntryCount, true}));
    EXPECT_EQ(cephdu::defaultSortMode(SortField::ChangeTime), (SortMode{SortField::ChangeTime, true}));
}

TEST(SortEngine, RepeatedRequestFlipsDirection)
{
    SortMode mode = cephdu::defaultSortMode(SortField::Size);
    mode = cephdu::nextSortMode(mode, SortField::Size);
    EXPECT_EQ(mode, (SortMode{SortField::Size, false}));
    mode = cephdu::nextSortMode(mode, SortField::Size);
    EXPECT_EQ(mode, (SortMode{SortField::Size, true}));

    mode = cephdu::nextSortMode(SortMode{SortField::Size, false}, SortField::Name);
    EXPECT_EQ(mode, (SortMode{SortField::Name, false}));
}

TEST(SortEngine, AbsentValuesSortFirst)
{
    std::vector<DirEntry> entries{entry("big", 900), entry("dir/", std::nullopt), entry("small", 10)};
    cephdu::sortEntries(entries, SortField::Size);
    EXPECT_EQ(names(entries), (std::vector<std::string>{"dir/", "small", "big"}));
}

TEST(SortEngine, TiesUseSecondaryKeys)
{
    std::vector<DirEntry> bySize{entry("a", 10, 7), entry("b", 10, 2), entry("c", 5, 9)};
    cephdu::sortEntries(bySize, SortField::Size);
    EXPECT_EQ(names(bySize), (std::vector<std::string>{"c", "b", "a"}));

    std::vector<DirEntry> byCount{entry("a", 30, 4), entry("b", 20, 4), entry("c", 1, std::nullopt)};
    cephdu::sortEntries(byCount, SortField::RecursiveEntryCount);
    EXPECT_EQ(names(byCount), (std::vector<std::string>{"c", "b", "a"}));
}

TEST(SortEngine, OwnerOrderingFallsBackToGroupThenSize)
{
    DirEntry a = entry("a", 50);
    a.owner = "bob";
    a.group = "staff";
    DirEntry b = entry("b", 10);
    b.owner = "bob";
    b.group = "staff";
    DirEntry c = entry("c", 99);
    c.owner = "alice";
    c.group = "wheel";

    std::vector<DirEntry> entries{a, b, c};
    cephdu::sortEntries(entries, SortField::Owner);
    EXPECT_EQ(names(entries), (std::vector<std::string>{"c", "b", "a"}));
}

TEST(SortEngine, NameSortIsByteWise)
{
    std::vector<DirEntry> entries{entry("beta", 1), entry("Alpha", 1), entry("alpha", 1)};
    cephdu::sortEntries(entries, SortField::Name);
    EXPECT_EQ(names(entries), (std::vector<std::string>{"Alpha", "alpha", "beta"}));
}

TEST(DisplayMapping, ReversedWithParentRow)
{
    cephdu::DisplayMapping mapping(3, true, true);
    EXPECT_EQ(mapping.displayLength(), 4u);
    EXPECT_TRUE(mapping.isParentRow(0));
    EXPECT_FALSE(mapping.storageSlot(0).has_value());
    EXPECT_EQ(mapping.storageSlot(1), 2u);
    EXPECT_EQ(mapping.storageSlot(3), 0u);
    EXPECT_FALSE(mapping.storageSlot(4).has_value());
    EXPECT_EQ(mapping.displayIndex(2), 1u);
    EXPECT_EQ(mapping.displayIndex(0), 3u);
}

TEST(DisplayMapping, ForwardWithoutParentRow)
{
    cephdu::DisplayMapping mapping(2, false, false);
    EXPECT_EQ(mapping.displayLength(), 2u);
    EXPECT_FALSE(mapping.isParentRow(0));
    EXPECT_EQ(mapping.storageSlot(0), 0u);
    EXPECT_EQ(mapping.storageSlot(1), 1u);
    EXPECT_EQ(mapping.displayIndex(1), 1u);

    cephdu::DisplayMapping empty(0, false, true);
    EXPECT_EQ(empty.displayLength(), 0u);
    EXPECT_FALSE(empty.storageSlot(0).has_value());
}

TEST(DisplayMapping, RoundTripsEveryRow)
{
    for (bool hasParent : {false, true})
    {
        for (bool reversed : {false, true})
        {
            cephdu::DisplayMapping mapping(7, hasParent, reversed);
            for (std::size_t row = 0; row < mapping.displayLength(); ++row)
            {
                std::optional<std::size_t> slot = mapping.storageSlot(row);
                if (mapping.isParentRow(row))
                {
                    EXPECT_FALSE(slot.has_value());
                    continue;
                }
                ASSERT_TRUE(slot.has_value());
                EXPECT_EQ(mapping.displayIndex(*slot), row);
            }
        }
    }
}
