#include <gtest/gtest.h>

#include "cephdu/options.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <random>
#include <string>
#include <vector>

namespace config = cephdu::config;

namespace
{

std::filesystem::path makeTempFilePath()
{
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        auto candidate = base / ("cephdu_options_test_" + std::to_string(dist(rng)) + ".json");
        if (!std::filesystem::exists(candidate))
            return candidate;
    }
    return base / "cephdu_options_test.json";
}

struct TempFile
{
    std::filesystem::path path = makeTempFilePath();
    ~TempFile()
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

config::OptionRegistry makeRegistry()
{
    config::OptionRegistry registry("cephdu-test");
    registry.registerOption({"showOwner", config::OptionKind::Boolean, config::OptionValue(false), "Owner column"});
    registry.registerOption({"gaugeWidth", config::OptionKind::Integer,
                             config::OptionValue(std::int64_t{20}), "Gauge cells"});
    registry.registerOption({"sortField", config::OptionKind::String, config::OptionValue("size"), "Initial sort"});
    return registry;
}

} // namespace

TEST(OptionRegistry, ReturnsDefaultsUntilOverridden)
{
    config::OptionRegistry registry = makeRegistry();

    EXPECT_TRUE(registry.hasOption("showOwner"));
    EXPECT_FALSE(registry.getBool("showOwner"));
    EXPECT_EQ(registry.getInteger("gaugeWidth"), 20);

    registry.set("showOwner", config::OptionValue(true));
    EXPECT_TRUE(registry.getBool("showOwner"));

    registry.reset("showOwner");
    EXPECT_FALSE(registry.getBool("showOwner"));
}

TEST(OptionRegistry, ConvertsValuesToDeclaredKind)
{
    config::OptionRegistry registry = makeRegistry();

    registry.set("gaugeWidth", config::OptionValue(std::string("32")));
    registry.set("showOwner", config::OptionValue(std::string("yes")));

    EXPECT_EQ(registry.get("gaugeWidth").kind(), config::OptionKind::Integer);
    EXPECT_EQ(registry.getInteger("gaugeWidth"), 32);
    EXPECT_TRUE(registry.getBool("showOwner"));
}

TEST(OptionRegistry, UnusableValueKeepsDefault)
{
    config::OptionRegistry registry = makeRegistry();
    registry.set("gaugeWidth", config::OptionValue(std::int64_t{8}));
    registry.set("gaugeWidth", config::OptionValue("wide"));
    registry.set("showOwner", config::OptionValue("maybe"));

    EXPECT_EQ(registry.getInteger("gaugeWidth"), 20);
    EXPECT_FALSE(registry.getBool("showOwner"));
    EXPECT_EQ(registry.get("showOwner").kind(), config::OptionKind::Boolean);
    EXPECT_FALSE(config::OptionValue().kind().has_value());
}

TEST(OptionRegistry, IgnoresUnknownKeys)
{
    config::OptionRegistry registry = makeRegistry();
    registry.set("colour", config::OptionValue("blue"));

    EXPECT_FALSE(registry.hasOption("colour"));
    EXPECT_TRUE(registry.get("colour").isNull());
}

TEST(OptionRegistry, SavesAndLoadsJson)
{
    config::OptionRegistry registry = makeRegistry();
    registry.set("sortField", config::OptionValue("entries"));
    registry.set("gaugeWidth", config::OptionValue(std::int64_t{12}));

    TempFile file;
    ASSERT_TRUE(registry.saveToFile(file.path));

    config::OptionRegistry loaded = makeRegistry();
    ASSERT_TRUE(loaded.loadFromFile(file.path));
    EXPECT_EQ(loaded.getString("sortField"), "entries");
    EXPECT_EQ(loaded.getInteger("gaugeWidth"), 12);
    EXPECT_FALSE(loaded.getBool("showOwner"));
}

TEST(OptionRegistry, SavedFileKeepsDeclaredJsonTypes)
{
    config::OptionRegistry registry = makeRegistry();
    registry.set("showOwner", config::OptionValue("on"));

    TempFile file;
    ASSERT_TRUE(registry.saveToFile(file.path));

    std::ifstream in(file.path);
    nlohmann::json saved = nlohmann::json::parse(in);
    ASSERT_TRUE(saved.is_object());
    EXPECT_EQ(saved.size(), 3u);
    EXPECT_TRUE(saved["showOwner"].is_boolean());
    EXPECT_TRUE(saved["showOwner"].get<bool>());
    EXPECT_TRUE(saved["gaugeWidth"].is_number_integer());
    EXPECT_EQ(saved["sortField"], "size");
}

TEST(OptionRegistry, RejectsMalformedFiles)
{
    TempFile file;
    {
        std::ofstream out(file.path);
        out << "[1, 2, 3]";
    }

    config::OptionRegistry registry = makeRegistry();
    EXPECT_FALSE(registry.loadFromFile(file.path));
    EXPECT_FALSE(registry.loadFromFile(file.path.string() + ".missing"));
    EXPECT_EQ(registry.getString("sortField"), "size");
}

TEST(OptionRegistry, FallsBackWhenJsonTypeIsWrong)
{
    TempFile file;
    {
        std::ofstream out(file.path);
        out << R"({"gaugeWidth": [1], "showOwner": "on", "unrelated": 5})";
    }

    config::OptionRegistry registry = makeRegistry();
    ASSERT_TRUE(registry.loadFromFile(file.path));
    EXPECT_EQ(registry.getInteger("gaugeWidth"), 20);
    EXPECT_TRUE(registry.getBool("showOwner"));
}

TEST(OptionParsing, ParsesBooleansAndIntegers)
{
    EXPECT_EQ(config::parseBool("TRUE"), true);
    EXPECT_EQ(config::parseBool("off"), false);
    EXPECT_FALSE(config::parseBool("maybe").has_value());

    EXPECT_EQ(config::parseInteger("-17"), -17);
    EXPECT_FALSE(config::parseInteger("12px").has_value());
    EXPECT_FALSE(config::parseInteger("").has_value());
}
