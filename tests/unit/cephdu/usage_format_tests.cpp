#include <gtest/gtest.h>

#include "usage_format.hpp"

#include <optional>
#include <string>

TEST(UsageFormat, SizesUseDecimalUnits)
{
    EXPECT_EQ(cephdu::sizeString(0), "0 B");
    EXPECT_EQ(cephdu::sizeString(999), "999 B");
    EXPECT_EQ(cephdu::sizeString(1500), "1.5 KB");
    EXPECT_EQ(cephdu::sizeString(1000000), "1.0 MB");
    EXPECT_EQ(cephdu::sizeString(2500000000000ULL), "2.5 TB");
    EXPECT_EQ(cephdu::sizeString(std::nullopt), "");
}

TEST(UsageFormat, AlignedSizesLineUpUnits)
{
    EXPECT_EQ(cephdu::sizeString(512, true), "512   B");
    EXPECT_EQ(cephdu::sizeString(1500, true), "1.5 KB");
    EXPECT_EQ(cephdu::sizeString(std::nullopt, true), "");
}

TEST(UsageFormat, EntryCounts)
{
    EXPECT_EQ(cephdu::entriesString(42), "42");
    EXPECT_EQ(cephdu::entriesString(42, true), "42    ");
    EXPECT_EQ(cephdu::entriesString(12340), "12.3 K");
    EXPECT_EQ(cephdu::entriesString(1500000), "1.5 M");
    EXPECT_EQ(cephdu::entriesString(std::nullopt), "");
}

TEST(UsageFormat, ChangeTimeHasMinutePrecision)
{
    EXPECT_EQ(cephdu::changeTimeString(std::nullopt), "");
    std::string text = cephdu::changeTimeString(1700000000);
    ASSERT_EQ(text.size(), 16u);
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[7], '-');
    EXPECT_EQ(text[10], ' ');
    EXPECT_EQ(text[13], ':');
}
