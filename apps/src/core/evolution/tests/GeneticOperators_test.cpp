#include "core/evolution/EvolutionConfig.h"
#include "core/evolution/GeneticOperators.h"
#include "core/evolution/OperatorRegistry.h"

#include <gtest/gtest.h>

using namespace GeneticCars;

class GeneticOperatorsTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };
    PointCrossover point;
    UniformCrossover uniform;
    BitFlipMutation bitFlip;
};

TEST_F(GeneticOperatorsTest, ZeroRateCrossoverReturnsFirstParent)
{
    const Genome a = Genome::random(130, rng);
    const Genome b = Genome::random(130, rng);

    EXPECT_EQ(point.crossover(a, b, 0.0, rng), a);
    EXPECT_EQ(uniform.crossover(a, b, 0.0, rng), a);
}

TEST_F(GeneticOperatorsTest, CrossoverOfIdenticalParentsIsThatParent)
{
    const Genome a = Genome::random(130, rng);

    for (const double rate : { 0.0, 0.4, 1.0 }) {
        EXPECT_EQ(point.crossover(a, a, rate, rng), a);
        EXPECT_EQ(uniform.crossover(a, a, rate, rng), a);
    }
}

TEST_F(GeneticOperatorsTest, FullRateUniformCrossoverReturnsSecondParent)
{
    const Genome a = Genome::random(130, rng);
    const Genome b = Genome::random(130, rng);

    EXPECT_EQ(uniform.crossover(a, b, 1.0, rng), b);
}

TEST_F(GeneticOperatorsTest, FullRatePointCrossoverAlternatesStrandEveryBit)
{
    const Genome zeros(6);
    const Genome ones = Genome::ones(6);

    const Genome child = point.crossover(zeros, ones, 1.0, rng);

    EXPECT_EQ(child.toString(), "010101");
}

TEST_F(GeneticOperatorsTest, EveryOffspringBitComesFromAParent)
{
    for (int i = 0; i < 200; ++i) {
        const Genome a = Genome::random(130, rng);
        const Genome b = Genome::random(130, rng);

        EXPECT_TRUE(checkCrossoverResult(a, b, point.crossover(a, b, 0.4, rng)).isValue());
        EXPECT_TRUE(checkCrossoverResult(a, b, uniform.crossover(a, b, 0.4, rng)).isValue());
    }
}

TEST_F(GeneticOperatorsTest, PointCrossoverMixesBothParentsAtModerateRate)
{
    const Genome zeros(130);
    const Genome ones = Genome::ones(130);

    const Genome child = point.crossover(zeros, ones, 0.4, rng);

    const size_t fromB = child.hammingDistance(zeros);
    EXPECT_GT(fromB, 0u);
    EXPECT_LT(fromB, 130u);
}

TEST_F(GeneticOperatorsTest, MutationFlipsExactlyFlipCountBits)
{
    for (const int flips : { 0, 1, 3, 17 }) {
        const Genome parent = Genome::random(130, rng);
        const Genome child = bitFlip.mutate(parent, flips, rng);

        EXPECT_EQ(child.hammingDistance(parent), static_cast<size_t>(flips));
        EXPECT_TRUE(checkMutationResult(parent, child, flips).isValue());
    }
}

TEST_F(GeneticOperatorsTest, MutationFlipCountIsCappedAtGenomeLength)
{
    const Genome parent(10);

    const Genome child = bitFlip.mutate(parent, 25, rng);

    EXPECT_EQ(child, Genome::ones(10));
}

TEST_F(GeneticOperatorsTest, SampleUniqueIndicesAreDistinctSortedAndInRange)
{
    const auto indices = sampleUniqueIndices(130, 40, rng);

    ASSERT_EQ(indices.size(), 40u);
    for (size_t i = 1; i < indices.size(); ++i) {
        EXPECT_LT(indices[i - 1], indices[i]);
    }
    EXPECT_LT(indices.back(), 130u);
}

TEST_F(GeneticOperatorsTest, SameRngStateGivesSameOffspring)
{
    const Genome a = Genome::random(130, rng);
    const Genome b = Genome::random(130, rng);
    std::mt19937 first{ 99 };
    std::mt19937 second{ 99 };

    EXPECT_EQ(point.crossover(a, b, 0.4, first), point.crossover(a, b, 0.4, second));
    EXPECT_EQ(bitFlip.mutate(a, 3, first), bitFlip.mutate(a, 3, second));
}

TEST_F(GeneticOperatorsTest, CrossoverCheckRejectsForeignBitsAndWrongLength)
{
    const Genome a(8);
    const Genome b(8);

    auto foreign = checkCrossoverResult(a, b, Genome(8).setBit(2, true));
    ASSERT_TRUE(foreign.isError());
    EXPECT_EQ(foreign.errorValue().kind, EvolutionError::Kind::OperatorFailure);

    EXPECT_TRUE(checkCrossoverResult(a, b, Genome(9)).isError());
}

TEST_F(GeneticOperatorsTest, MutationCheckRejectsWrongFlipCount)
{
    const Genome parent(16);

    EXPECT_TRUE(checkMutationResult(parent, parent, 3).isError());
    EXPECT_TRUE(checkMutationResult(parent, parent.withFlippedBits({ 1, 2, 3, 4 }), 3).isError());
    EXPECT_TRUE(checkMutationResult(parent, parent.withFlippedBits({ 1, 2, 3 }), 3).isValue());
}

TEST(OperatorRegistryTest, DefaultRegistryKnowsBuiltIns)
{
    const OperatorRegistry registry = OperatorRegistry::createDefault();

    ASSERT_NE(registry.findCrossover(OperatorName::PointCrossover), nullptr);
    ASSERT_NE(registry.findCrossover(OperatorName::UniformCrossover), nullptr);
    ASSERT_NE(registry.findMutation(OperatorName::BitFlip), nullptr);
    EXPECT_EQ(registry.findCrossover("Nope"), nullptr);
    EXPECT_EQ(registry.findCrossover(OperatorName::UniformCrossover)->name(), "UniformCrossover");

    const std::vector<std::string> expected{ "PointCrossover", "UniformCrossover" };
    EXPECT_EQ(registry.crossoverNames(), expected);
    EXPECT_EQ(registry.mutationNames(), std::vector<std::string>{ "BitFlip" });
}

TEST(OperatorRegistryTest, BindRejectsUnknownOperatorNames)
{
    const OperatorRegistry registry = OperatorRegistry::createDefault();
    EvolutionConfig config;
    config.mutationOperator = "GaussianNoise";

    auto result = registry.bind(config);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, EvolutionError::Kind::ConfigurationError);
}

TEST(OperatorRegistryTest, BindWithoutModuleUsesBuiltInsForBothSlots)
{
    const OperatorRegistry registry = OperatorRegistry::createDefault();
    EvolutionConfig config;
    config.crossoverOperator = OperatorName::UniformCrossover;

    auto result = registry.bind(config);

    ASSERT_TRUE(result.isValue());
    const OperatorSet& set = result.value();
    EXPECT_EQ(set.crossover->name(), "UniformCrossover");
    EXPECT_EQ(set.crossover, set.builtInCrossover);
    EXPECT_EQ(set.mutation, set.builtInMutation);
    EXPECT_TRUE(set.warnings.empty());
}

TEST(OperatorRegistryTest, MissingModuleFileFallsBackToBuiltIns)
{
    const OperatorRegistry registry = OperatorRegistry::createDefault();
    EvolutionConfig config;
    config.operatorModule = "/nonexistent/libnothing.so";

    auto result = registry.bind(config);

    ASSERT_TRUE(result.isValue());
    const OperatorSet& set = result.value();
    EXPECT_EQ(set.crossover, set.builtInCrossover);
    EXPECT_EQ(set.mutation, set.builtInMutation);
    EXPECT_EQ(set.module, nullptr);
    ASSERT_EQ(set.warnings.size(), 1u);
    EXPECT_EQ(set.warnings[0].kind, EvolutionError::Kind::ConfigurationError);
    EXPECT_NE(set.warnings[0].message.find("/nonexistent/libnothing.so"), std::string::npos);
}
