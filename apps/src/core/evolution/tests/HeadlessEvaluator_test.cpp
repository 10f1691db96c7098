#include "core/evolution/Genome.h"
#include "core/evolution/HeadlessEvaluator.h"
#include "core/evolution/PhenotypeDecoder.h"

#include <gtest/gtest.h>
#include <random>

using namespace GeneticCars;

TEST(HeadlessEvaluatorTest, ScoreIsBoundedAndDeterministic)
{
    const HeadlessEvaluator evaluator;
    const PhenotypeDecoder decoder(GenomeLayout::standard());
    std::mt19937 rng{ 42 };

    for (int i = 0; i < 200; ++i) {
        auto decoded = decoder.decode(Genome::random(decoder.genomeLength(), rng));
        ASSERT_TRUE(decoded.isValue());
        const double score = evaluator.evaluate(decoded.value());
        EXPECT_GE(score, 0.0);
        EXPECT_LT(score, evaluator.trackLength());
        EXPECT_DOUBLE_EQ(score, evaluator.evaluate(decoded.value()));
    }
}

TEST(HeadlessEvaluatorTest, MoreTorqueNeverHurts)
{
    const HeadlessEvaluator evaluator;
    const PhenotypeDecoder decoder(GenomeLayout::standard());
    std::mt19937 rng{ 3 };
    auto decoded = decoder.decode(Genome::random(decoder.genomeLength(), rng));
    ASSERT_TRUE(decoded.isValue());

    VehicleDefinition weak = decoded.value();
    weak.wheelTorque = VehicleLimits::MinWheelTorque;
    VehicleDefinition strong = decoded.value();
    strong.wheelTorque = VehicleLimits::MaxWheelTorque;

    EXPECT_GE(evaluator.evaluate(strong), evaluator.evaluate(weak));
}

TEST(HeadlessEvaluatorTest, RegularBodyAreaMatchesPolygonFormula)
{
    const HeadlessEvaluator evaluator;
    VehicleDefinition square;
    square.bodyPointDistances = { 1.0, 1.0, 1.0, 1.0 };

    // Square with unit circumradius has area 2.
    EXPECT_NEAR(evaluator.bodyArea(square), 2.0, 1e-12);
}
