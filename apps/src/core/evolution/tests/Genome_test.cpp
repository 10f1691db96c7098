#include "core/evolution/Genome.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace GeneticCars;

class GenomeTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };
};

TEST_F(GenomeTest, DefaultConstructedGenomeIsAllZeros)
{
    const Genome genome(130);

    EXPECT_EQ(genome.size(), 130u);
    for (size_t i = 0; i < genome.size(); ++i) {
        EXPECT_FALSE(genome.bit(i));
    }
}

TEST_F(GenomeTest, RandomIsReproducibleFromSameSeed)
{
    std::mt19937 rngA{ 7 };
    std::mt19937 rngB{ 7 };

    const Genome a = Genome::random(130, rngA);
    const Genome b = Genome::random(130, rngB);

    EXPECT_EQ(a, b);
}

TEST_F(GenomeTest, RandomGenomesDifferAcrossDraws)
{
    const Genome a = Genome::random(130, rng);
    const Genome b = Genome::random(130, rng);

    EXPECT_NE(a, b);
}

TEST_F(GenomeTest, RandomGenomeHasRoughlyHalfBitsSet)
{
    const Genome genome = Genome::random(4096, rng);

    const size_t ones = genome.hammingDistance(Genome(4096));
    EXPECT_GT(ones, 1800u);
    EXPECT_LT(ones, 2300u);
}

TEST_F(GenomeTest, SetBitReturnsNewGenomeAndLeavesOriginal)
{
    const Genome original(10);

    const Genome changed = original.setBit(3, true);

    EXPECT_FALSE(original.bit(3));
    EXPECT_TRUE(changed.bit(3));
    EXPECT_EQ(changed.hammingDistance(original), 1u);
}

TEST_F(GenomeTest, WithFlippedBitsFlipsEachListedPosition)
{
    const Genome original = Genome::random(130, rng);

    const Genome flipped = original.withFlippedBits({ 0, 63, 64, 129 });

    EXPECT_EQ(flipped.hammingDistance(original), 4u);
    EXPECT_NE(flipped.bit(0), original.bit(0));
    EXPECT_NE(flipped.bit(63), original.bit(63));
    EXPECT_NE(flipped.bit(64), original.bit(64));
    EXPECT_NE(flipped.bit(129), original.bit(129));
}

TEST_F(GenomeTest, ExtractReadsMostSignificantBitFirst)
{
    auto parsed = Genome::fromString("0110100000");
    ASSERT_TRUE(parsed.isValue());

    EXPECT_EQ(parsed.value().extract(0, 4), 0b0110u);
    EXPECT_EQ(parsed.value().extract(1, 4), 0b1101u);
    EXPECT_EQ(parsed.value().extract(4, 6), 0b100000u);
}

TEST_F(GenomeTest, ExtractSpansWordBoundary)
{
    const Genome genome = Genome(130).withFlippedBits({ 62, 63, 64, 65 });

    EXPECT_EQ(genome.extract(60, 8), 0b00111100u);
}

TEST_F(GenomeTest, StringFormRoundTripsAndStartsAtBitZero)
{
    const Genome genome = Genome(5).setBit(0, true);

    EXPECT_EQ(genome.toString(), "10000");

    auto parsed = Genome::fromString(genome.toString());
    ASSERT_TRUE(parsed.isValue());
    EXPECT_EQ(parsed.value(), genome);
}

TEST_F(GenomeTest, FromStringRejectsOtherCharacters)
{
    auto parsed = Genome::fromString("0102");

    ASSERT_TRUE(parsed.isError());
    EXPECT_NE(parsed.errorValue().find("position 3"), std::string::npos);
}

TEST_F(GenomeTest, FromBitValuesRejectsValuesOtherThanZeroOrOne)
{
    EXPECT_TRUE(Genome::fromBitValues({ 0, 1, 1, 0 }).isValue());
    EXPECT_TRUE(Genome::fromBitValues({ 0, 2, 1 }).isError());
}

TEST_F(GenomeTest, BinaryFormRestoresGenome)
{
    const Genome genome = Genome::random(130, rng);

    auto restored = Genome::fromBytes(genome.toBytes());

    ASSERT_TRUE(restored.isValue());
    EXPECT_EQ(restored.value(), genome);
}

TEST_F(GenomeTest, BinaryFormRejectsTruncatedData)
{
    auto bytes = Genome::random(130, rng).toBytes();
    bytes.resize(bytes.size() / 2);

    EXPECT_TRUE(Genome::fromBytes(bytes).isError());
}

TEST_F(GenomeTest, JsonUsesTextualForm)
{
    const Genome genome = Genome::ones(4);

    const nlohmann::json j = genome;
    EXPECT_EQ(j.get<std::string>(), "1111");
    EXPECT_EQ(j.get<Genome>(), genome);
}

TEST_F(GenomeTest, GenomesOfDifferentLengthAreNotEqual)
{
    EXPECT_NE(Genome(8), Genome(9));
}

TEST(GenomeDeathTest, OutOfRangeBitAborts)
{
    const Genome genome(8);
    EXPECT_DEATH((void)genome.bit(8), "");
}
