#include <gtest/gtest.h>
#include "terranoise/config_parser.hpp"

#include <filesystem>
#include <fstream>

using namespace terranoise;

class ConfigParserTest : public ::testing::Test {
protected:
    ConfigParser parser;
};

TEST_F(ConfigParserTest, SimpleKeyValue) {
    auto doc = parser.parseString("model: ridged\n");

    EXPECT_EQ(doc.size(), 1);
    EXPECT_EQ(doc.getString("model"), "ridged");
}

TEST_F(ConfigParserTest, MultipleKeyValues) {
    auto doc = parser.parseString(
        "model: swiss\n"
        "lacunarity: 1.92\n"
        "octaves: 12\n"
    );

    EXPECT_EQ(doc.size(), 3);
    EXPECT_EQ(doc.getString("model"), "swiss");
    EXPECT_DOUBLE_EQ(doc.getDouble("lacunarity"), 1.92);
    EXPECT_EQ(doc.getInt("octaves"), 12);
}

TEST_F(ConfigParserTest, NumericValues) {
    auto doc = parser.parseString(
        "width: 1000e3\n"
        "height: -2.5\n"
        "count: 42\n"
        "word: stone\n"
    );

    EXPECT_DOUBLE_EQ(doc.getDouble("width"), 1000e3);
    EXPECT_DOUBLE_EQ(doc.getDouble("height"), -2.5);
    EXPECT_EQ(doc.getInt("count"), 42);
    EXPECT_DOUBLE_EQ(doc.getDouble("word", 7.0), 7.0);
    EXPECT_EQ(doc.getInt("word", -1), -1);
}

TEST_F(ConfigParserTest, DefaultsForMissingKeys) {
    auto doc = parser.parseString("model: ridged\n");

    EXPECT_EQ(doc.getString("missing", "fallback"), "fallback");
    EXPECT_DOUBLE_EQ(doc.getDouble("missing", 3.5), 3.5);
    EXPECT_EQ(doc.getInt("missing", 9), 9);
    EXPECT_EQ(doc.getUInt64("missing", 11u), 11u);
    EXPECT_FALSE(doc.has("missing"));
    EXPECT_TRUE(doc.has("model"));
}

TEST_F(ConfigParserTest, UnsignedValues) {
    auto doc = parser.parseString(
        "seed: 18446744073709551615\n"
        "negative: -5\n"
        "huge: 99999999999999999999999\n"
        "fraction: 42.9\n"
        "plus: +7\n"
    );

    EXPECT_EQ(doc.getUInt64("seed"), 18446744073709551615ull);
    EXPECT_EQ(doc.getUInt64("negative", 3u), 3u);
    EXPECT_EQ(doc.getUInt64("huge", 4u), 4u);
    EXPECT_EQ(doc.getUInt64("fraction", 5u), 5u);
    EXPECT_EQ(doc.getUInt64("plus", 6u), 6u);
}

TEST_F(ConfigParserTest, IntegersMustBeWhole) {
    auto doc = parser.parseString(
        "fraction: 12.7\n"
        "exponent: 1e3\n"
        "wide: 4294967300\n"
        "negative: -12\n"
        "trailing: 12abc\n"
    );

    EXPECT_EQ(doc.getInt("fraction", -1), -1);
    EXPECT_EQ(doc.getInt("exponent", -1), -1);
    EXPECT_EQ(doc.getInt("wide", -1), -1);
    EXPECT_EQ(doc.getInt("negative", 0), -12);
    EXPECT_EQ(doc.getInt("trailing", -1), -1);
}

TEST_F(ConfigParserTest, IntegerClassification) {
    EXPECT_TRUE(ConfigValue("12").isInteger());
    EXPECT_TRUE(ConfigValue("-12").isInteger());
    EXPECT_TRUE(ConfigValue("4294967300").isInteger());
    EXPECT_FALSE(ConfigValue("12.7").isInteger());
    EXPECT_FALSE(ConfigValue("1e3").isInteger());
    EXPECT_FALSE(ConfigValue("99999999999999999999999").isInteger());
    EXPECT_FALSE(ConfigValue("").isInteger());

    EXPECT_TRUE(ConfigValue("18446744073709551615").isUnsigned());
    EXPECT_FALSE(ConfigValue("18446744073709551616").isUnsigned());
    EXPECT_FALSE(ConfigValue("-5").isUnsigned());
    EXPECT_FALSE(ConfigValue("42.9").isUnsigned());
}

TEST_F(ConfigParserTest, IsNumber) {
    EXPECT_TRUE(ConfigValue("12").isNumber());
    EXPECT_TRUE(ConfigValue("-0.35").isNumber());
    EXPECT_TRUE(ConfigValue("20e3").isNumber());
    EXPECT_FALSE(ConfigValue("").isNumber());
    EXPECT_FALSE(ConfigValue("abc").isNumber());
    EXPECT_FALSE(ConfigValue("12abc").isNumber());
}

TEST_F(ConfigParserTest, Comments) {
    auto doc = parser.parseString(
        "# This is a comment\n"
        "model: jordan\n"
        "   # Indented comment\n"
        "seed: 42\n"
    );

    EXPECT_EQ(doc.size(), 2);
    EXPECT_EQ(doc.getString("model"), "jordan");
}

TEST_F(ConfigParserTest, EmptyLinesAndWhitespace) {
    auto doc = parser.parseString(
        "\n"
        "   model   :   plaw   \n"
        "\n"
        "\t\n"
    );

    EXPECT_EQ(doc.size(), 1);
    EXPECT_EQ(doc.getString("model"), "plaw");
}

TEST_F(ConfigParserTest, WindowsLineEndings) {
    auto doc = parser.parseString("model: ridged\r\nseed: 7\r\n");

    EXPECT_EQ(doc.size(), 2);
    EXPECT_EQ(doc.getString("model"), "ridged");
    EXPECT_EQ(doc.getUInt64("seed"), 7u);
}

TEST_F(ConfigParserTest, NoTrailingNewline) {
    auto doc = parser.parseString("model: ridged\nseed: 99");

    EXPECT_EQ(doc.size(), 2);
    EXPECT_EQ(doc.getUInt64("seed"), 99u);
}

TEST_F(ConfigParserTest, LaterEntryWins) {
    auto doc = parser.parseString(
        "octaves: 4\n"
        "octaves: 8\n"
    );

    EXPECT_EQ(doc.size(), 2);
    EXPECT_EQ(doc.getInt("octaves"), 8);
}

TEST_F(ConfigParserTest, LineNumbers) {
    auto doc = parser.parseString(
        "# header\n"
        "\n"
        "model: swiss\n"
    );

    ASSERT_NE(doc.get("model"), nullptr);
    EXPECT_EQ(doc.get("model")->line, 3);
}

TEST_F(ConfigParserTest, MalformedLinesSkipped) {
    auto doc = parser.parseString(
        "no colon here\n"
        ": no key\n"
        "model: ridged\n"
    );

    EXPECT_EQ(doc.size(), 1);
    EXPECT_EQ(doc.getString("model"), "ridged");
}

TEST_F(ConfigParserTest, ValueWithColon) {
    auto doc = parser.parseString("path: /data/a:b\n");
    EXPECT_EQ(doc.getString("path"), "/data/a:b");
}

TEST_F(ConfigParserTest, Iteration) {
    auto doc = parser.parseString(
        "a: 1\n"
        "b: 2\n"
    );

    int count = 0;
    for (const auto& entry : doc) {
        EXPECT_FALSE(entry.key.empty());
        ++count;
    }
    EXPECT_EQ(count, 2);
}

// ============================================================================
// Files and includes
// ============================================================================

class ConfigFileIncludeTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "terranoise_config_parser_test";
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    void writeFile(const std::string& name, const std::string& content) {
        std::ofstream file(tempDir / name);
        file << content;
    }

    std::filesystem::path tempDir;
    ConfigParser parser;
};

TEST_F(ConfigFileIncludeTest, MissingFile) {
    EXPECT_FALSE(parser.parseFile((tempDir / "nope.noise").string()).has_value());
}

TEST_F(ConfigFileIncludeTest, RelativeInclude) {
    writeFile("base.noise", "model: ridged\noctaves: 6\n");
    writeFile("moon.noise", "include: base.noise\noctaves: 10\n");

    auto doc = parser.parseFile((tempDir / "moon.noise").string());
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->getString("model"), "ridged");
    EXPECT_EQ(doc->getInt("octaves"), 10);
}

TEST_F(ConfigFileIncludeTest, IncludeBeforeOverride) {
    writeFile("base.noise", "seed: 5\n");
    writeFile("top.noise", "seed: 1\ninclude: base.noise\n");

    auto doc = parser.parseFile((tempDir / "top.noise").string());
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->getUInt64("seed"), 5u);
}

TEST_F(ConfigFileIncludeTest, ParseStringWithBasePath) {
    writeFile("base.noise", "model: swiss\n");

    auto doc = parser.parseString("include: base.noise\n", tempDir.string() + "/");
    EXPECT_EQ(doc.getString("model"), "swiss");
}

TEST_F(ConfigFileIncludeTest, MissingIncludeSkipped) {
    writeFile("top.noise", "include: absent.noise\nmodel: jordan\n");

    auto doc = parser.parseFile((tempDir / "top.noise").string());
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->size(), 1);
    EXPECT_EQ(doc->getString("model"), "jordan");
}

TEST_F(ConfigFileIncludeTest, CustomResolver) {
    writeFile("shared.noise", "warp: 0.5\n");

    std::string requested;
    parser.setIncludeResolver([&](const std::string& path) {
        requested = path;
        return (tempDir / "shared.noise").string();
    });

    auto doc = parser.parseString("include: presets/common\n");
    EXPECT_EQ(requested, "presets/common");
    EXPECT_DOUBLE_EQ(doc.getDouble("warp"), 0.5);
}

TEST_F(ConfigFileIncludeTest, SelfIncludeStopsAtDepthLimit) {
    writeFile("loop.noise", "include: loop.noise\nseed: 3\n");

    auto doc = parser.parseFile((tempDir / "loop.noise").string());
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->size(), static_cast<size_t>(ConfigParser::kMaxIncludeDepth + 1));
    EXPECT_EQ(doc->getUInt64("seed"), 3u);
}
