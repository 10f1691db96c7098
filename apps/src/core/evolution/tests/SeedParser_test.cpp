#include "core/evolution/RandomStreams.h"
#include "core/evolution/SeedParser.h"

#include <gtest/gtest.h>

using namespace GeneticCars;

TEST(SeedParserTest, HexPrefixParsesHexadecimal)
{
    auto lower = parseSeed("\\x2a");
    auto upper = parseSeed("\\XFF");

    ASSERT_TRUE(lower.isValue());
    ASSERT_TRUE(upper.isValue());
    EXPECT_EQ(lower.value(), 42u);
    EXPECT_EQ(upper.value(), 255u);
}

TEST(SeedParserTest, DecimalPrefixParsesDecimal)
{
    auto result = parseSeed("\\d18446744073709551615");

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value(), UINT64_MAX);
}

TEST(SeedParserTest, OtherTextIsHashed)
{
    auto result = parseSeed("dunes");

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value(), hashSeedText("dunes"));
    EXPECT_NE(hashSeedText("dunes"), hashSeedText("Dunes"));
}

TEST(SeedParserTest, FnvHashMatchesKnownValues)
{
    EXPECT_EQ(hashSeedText(""), 0xcbf29ce484222325ull);
    EXPECT_EQ(hashSeedText("a"), 0xaf63dc4c8601ec8cull);
}

TEST(SeedParserTest, RejectsEmptyAndMalformedNumbers)
{
    EXPECT_TRUE(parseSeed("").isError());
    EXPECT_TRUE(parseSeed("\\x").isError());
    EXPECT_TRUE(parseSeed("\\xZZ").isError());
    EXPECT_TRUE(parseSeed("\\d12a").isError());
    EXPECT_TRUE(parseSeed("\\d18446744073709551616").isError());
}

TEST(SeedParserTest, BackslashWithoutKnownPrefixIsHashed)
{
    auto result = parseSeed("\\q7");

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value(), hashSeedText("\\q7"));
}

TEST(RandomStreamsTest, SameSlotGivesSameSequence)
{
    auto a = deriveStream(42, 3, 7, StreamPurpose::Breeding);
    auto b = deriveStream(42, 3, 7, StreamPurpose::Breeding);

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(a(), b());
    }
}

TEST(RandomStreamsTest, EverySlotComponentChangesTheStream)
{
    const auto first = deriveStream(42, 3, 7, StreamPurpose::Breeding)();

    EXPECT_NE(deriveStream(43, 3, 7, StreamPurpose::Breeding)(), first);
    EXPECT_NE(deriveStream(42, 4, 7, StreamPurpose::Breeding)(), first);
    EXPECT_NE(deriveStream(42, 3, 8, StreamPurpose::Breeding)(), first);
    EXPECT_NE(deriveStream(42, 3, 7, StreamPurpose::Fallback)(), first);
    EXPECT_NE(deriveStream(42ull | (1ull << 40), 3, 7, StreamPurpose::Breeding)(), first);
}
