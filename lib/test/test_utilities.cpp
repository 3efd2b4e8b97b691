#include "Utilities.h"
#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

namespace txl {
namespace utl {

TEST(ParseIntTest, UnsignedRejectsSignAndGarbage) {
    uint64_t value = 0;
    EXPECT_TRUE(parseUInt64("18446744073709551615", value));
    EXPECT_EQ(value, UINT64_MAX);
    EXPECT_FALSE(parseUInt64("-1", value));
    EXPECT_FALSE(parseUInt64(" 1", value));
    EXPECT_FALSE(parseUInt64("", value));
}

TEST(ParseIntTest, NarrowTypesCheckRange) {
    uint16_t client = 0;
    EXPECT_TRUE(parseUInt16("65535", client));
    EXPECT_EQ(client, 65535);
    EXPECT_FALSE(parseUInt16("65536", client));

    uint32_t tx = 0;
    EXPECT_TRUE(parseUInt32("4294967295", tx));
    EXPECT_EQ(tx, 4294967295u);
    EXPECT_FALSE(parseUInt32("4294967296", tx));
}

TEST(StringTest, TrimStripsWhitespace) {
    EXPECT_EQ(trim("  deposit\t"), "deposit");
    EXPECT_EQ(trim("1.5\r\n"), "1.5");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(StringTest, ToLowerConvertsAscii) {
    EXPECT_EQ(toLower("ChargeBack"), "chargeback");
}

TEST(StringTest, SplitKeepsEmptyFields) {
    auto parts = split("deposit,1,,", ',');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "deposit");
    EXPECT_EQ(parts[1], "1");
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(parts[3], "");

    EXPECT_EQ(split("", ',').size(), 1u);
}

TEST(LoadJsonFileTest, MissingFileIsError) {
    auto result = loadJsonFile("/nonexistent-dir/config.json");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, 1);
}

TEST(LoadJsonFileTest, ParsesValidFileAndRejectsInvalid) {
    auto dir = std::filesystem::temp_directory_path();
    auto good = (dir / "txledger_utl_good.json").string();
    auto bad = (dir / "txledger_utl_bad.json").string();
    {
        std::ofstream(good) << R"({"logLevel": "debug", "strict": true})";
        std::ofstream(bad) << "{ not json";
    }

    auto parsed = loadJsonFile(good);
    ASSERT_TRUE(parsed.isOk()) << parsed.error().message;
    EXPECT_EQ(parsed.value()["logLevel"], "debug");
    EXPECT_TRUE(parsed.value()["strict"].get<bool>());

    auto broken = loadJsonFile(bad);
    ASSERT_TRUE(broken.isError());
    EXPECT_EQ(broken.error().code, 3);

    std::remove(good.c_str());
    std::remove(bad.c_str());
}

} // namespace utl
} // namespace txl
