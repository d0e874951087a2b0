#include <gtest/gtest.h>
#include "engine/Config.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

using namespace trellis;

namespace {

std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

void writeFile(const std::string& path, const std::string& contents) {
    std::ofstream out(path);
    out << contents;
}

} // anonymous namespace

TEST(ConfigTest, LoadFromValidString) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"name": "grid", "maxRows": 3})"));
    EXPECT_EQ(cfg.getString("name"), "grid");
    EXPECT_EQ(cfg.getInt("maxRows"), 3);
}

TEST(ConfigTest, LoadFromInvalidStringKeepsData) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"maxRows": 3})"));
    EXPECT_FALSE(cfg.loadFromString("{invalid json}"));
    EXPECT_EQ(cfg.getInt("maxRows"), 3);
}

TEST(ConfigTest, LoadFromMissingFile) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromFile("nonexistent_file.json"));
}

TEST(ConfigTest, LoadFromFile) {
    std::string path = tempPath("trellis_test_config.json");
    writeFile(path, R"({"uniformGrid": {"maxRows": 2, "maxColumns": "unbounded"}})");

    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.getInt("uniformGrid.maxRows"), 2);
    EXPECT_EQ(cfg.getString("uniformGrid.maxColumns"), "unbounded");

    std::remove(path.c_str());
}

TEST(ConfigTest, LoadFromMalformedFileKeepsData) {
    std::string path = tempPath("trellis_test_malformed.json");
    writeFile(path, "{\"uniformGrid\": ");

    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"kept": 1})"));
    EXPECT_FALSE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.getInt("kept"), 1);

    std::remove(path.c_str());
}

TEST(ConfigTest, DotNotation) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "uniformGrid": {"maxRows": 4, "cellSize": "largestVisible"},
        "demo": {"width": 250.5}
    })"));

    EXPECT_EQ(cfg.getInt("uniformGrid.maxRows"), 4);
    EXPECT_EQ(cfg.getString("uniformGrid.cellSize"), "largestVisible");
    EXPECT_DOUBLE_EQ(cfg.getDouble("demo.width"), 250.5);
}

TEST(ConfigTest, HasKey) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"a": {"b": 1}})"));

    EXPECT_TRUE(cfg.hasKey("a"));
    EXPECT_TRUE(cfg.hasKey("a.b"));
    EXPECT_FALSE(cfg.hasKey("a.c"));
    EXPECT_FALSE(cfg.hasKey("a.b.c"));
    EXPECT_FALSE(cfg.hasKey("x"));
}

TEST(ConfigTest, EmptyConfigBeforeLoad) {
    Config cfg;
    EXPECT_FALSE(cfg.hasKey("anything"));
    EXPECT_EQ(cfg.getInt("anything", 7), 7);
}

TEST(ConfigTest, DefaultsAndTypeMismatch) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"name": "hello", "count": 5, "list": [1, 2]})"));

    EXPECT_EQ(cfg.getString("missing", "fallback"), "fallback");
    EXPECT_DOUBLE_EQ(cfg.getDouble("missing", 2.5), 2.5);
    EXPECT_EQ(cfg.getInt("name", -1), -1);
    EXPECT_EQ(cfg.getString("count", "nope"), "nope");
    EXPECT_EQ(cfg.getInt("list", -1), -1);
    EXPECT_DOUBLE_EQ(cfg.getDouble("count"), 5.0);
}

TEST(ConfigTest, IsInteger) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"rows": 3, "width": 250.5, "cap": "unbounded"})"));

    EXPECT_TRUE(cfg.isInteger("rows"));
    EXPECT_FALSE(cfg.isInteger("width"));
    EXPECT_FALSE(cfg.isInteger("cap"));
    EXPECT_FALSE(cfg.isInteger("missing"));
}

TEST(ConfigTest, IntOutsideRangeReturnsDefault) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "big": 4294967296, "negative": -4294967296, "huge": 18446744073709551615
    })"));

    EXPECT_EQ(cfg.getInt("big", 9), 9);
    EXPECT_EQ(cfg.getInt("negative", 9), 9);
    EXPECT_EQ(cfg.getInt("huge", 9), 9);

    EXPECT_EQ(cfg.getInt64("big"), 4294967296LL);
    EXPECT_EQ(cfg.getInt64("negative"), -4294967296LL);
    EXPECT_EQ(cfg.getInt64("huge", -1), -1);
}

TEST(ConfigTest, Extent) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"w": 400, "h": "infinite", "bad": "wide"})"));

    EXPECT_DOUBLE_EQ(cfg.getExtent("w", 0.0), 400.0);
    EXPECT_TRUE(std::isinf(cfg.getExtent("h", 0.0)));
    EXPECT_GT(cfg.getExtent("h", 0.0), 0.0);
    EXPECT_DOUBLE_EQ(cfg.getExtent("bad", 12.0), 12.0);
    EXPECT_DOUBLE_EQ(cfg.getExtent("missing", 3.0), 3.0);
}
