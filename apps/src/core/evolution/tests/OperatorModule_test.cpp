#include "core/evolution/EvolutionConfig.h"
#include "core/evolution/GenerationManager.h"
#include "core/evolution/OperatorModule.h"
#include "core/evolution/OperatorRegistry.h"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace GeneticCars;

// Module paths are injected by the build.
#ifndef GENETICCARS_SAMPLE_MODULE_PATH
#error "GENETICCARS_SAMPLE_MODULE_PATH must point at the sample operator module"
#endif

class OperatorModuleTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };

    static std::shared_ptr<OperatorModule> loadModule(const char* path)
    {
        auto result = OperatorModule::load(path);
        EXPECT_TRUE(result.isValue());
        return result.isValue() ? result.value() : nullptr;
    }
};

TEST_F(OperatorModuleTest, LoadFailsForMissingLibrary)
{
    auto result = OperatorModule::load("/nonexistent/libgeneticcars-nothing.so");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, EvolutionError::Kind::ConfigurationError);
}

TEST_F(OperatorModuleTest, SampleModuleExportsBothRoles)
{
    auto module = loadModule(GENETICCARS_SAMPLE_MODULE_PATH);
    ASSERT_NE(module, nullptr);

    EXPECT_TRUE(module->hasCrossover());
    EXPECT_TRUE(module->hasMutation());
}

TEST_F(OperatorModuleTest, SampleModuleHonoursOperatorContracts)
{
    auto module = loadModule(GENETICCARS_SAMPLE_MODULE_PATH);
    ASSERT_NE(module, nullptr);
    auto crossover = module->crossoverOperator();
    auto mutation = module->mutationOperator();
    ASSERT_TRUE(crossover.isValue());
    ASSERT_TRUE(mutation.isValue());

    for (int i = 0; i < 50; ++i) {
        const Genome a = Genome::random(130, rng);
        const Genome b = Genome::random(130, rng);

        const Genome child = crossover.value()->crossover(a, b, 0.4, rng);
        EXPECT_TRUE(checkCrossoverResult(a, b, child).isValue());
        EXPECT_EQ(crossover.value()->crossover(a, b, 0.0, rng), a);

        const Genome mutant = mutation.value()->mutate(child, 3, rng);
        EXPECT_TRUE(checkMutationResult(child, mutant, 3).isValue());
    }
}

TEST_F(OperatorModuleTest, OperatorsKeepModuleLoadedAfterHandleIsDropped)
{
    std::shared_ptr<const MutationOperator> mutation;
    {
        auto module = loadModule(GENETICCARS_SAMPLE_MODULE_PATH);
        ASSERT_NE(module, nullptr);
        auto result = module->mutationOperator();
        ASSERT_TRUE(result.isValue());
        mutation = result.value();
    }

    const Genome parent(64);
    EXPECT_EQ(mutation->mutate(parent, 5, rng).hammingDistance(parent), 5u);
}

TEST_F(OperatorModuleTest, NonZeroStatusThrows)
{
    auto module = loadModule(GENETICCARS_FAILING_MODULE_PATH);
    ASSERT_NE(module, nullptr);
    auto crossover = module->crossoverOperator();
    ASSERT_TRUE(crossover.isValue());

    const Genome a(16);
    EXPECT_THROW(crossover.value()->crossover(a, a, 0.4, rng), std::runtime_error);
}

TEST_F(OperatorModuleTest, MissingSymbolFallsBackWithWarning)
{
    EvolutionConfig config;
    config.operatorModule = GENETICCARS_PARTIAL_MODULE_PATH;

    auto bound = OperatorRegistry::createDefault().bind(config);

    ASSERT_TRUE(bound.isValue());
    const OperatorSet& set = bound.value();
    EXPECT_NE(set.crossover, set.builtInCrossover);
    EXPECT_EQ(set.mutation, set.builtInMutation);
    ASSERT_EQ(set.warnings.size(), 1u);
    EXPECT_EQ(set.warnings[0].kind, EvolutionError::Kind::ConfigurationError);
    EXPECT_NE(set.warnings[0].message.find("geneticcars_mutate"), std::string::npos);
}

TEST_F(OperatorModuleTest, ManagerRunsWithSampleModule)
{
    EvolutionConfig config;
    config.operatorModule = GENETICCARS_SAMPLE_MODULE_PATH;

    auto created = GenerationManager::create(config, 42);
    ASSERT_TRUE(created.isValue());
    auto& manager = *created.value();
    EXPECT_TRUE(manager.operatorWarnings().empty());

    for (IndividualId id = 0; id < 20; ++id) {
        ASSERT_TRUE(manager.reportFitness(id, static_cast<double>(id)).isValue());
    }
    auto advanced = manager.advance();

    ASSERT_TRUE(advanced.isValue());
    EXPECT_EQ(advanced.value().total(), 0);
    EXPECT_EQ(manager.generation(), 2u);
}

TEST_F(OperatorModuleTest, FailingModuleIsRecoveredByBuiltIns)
{
    EvolutionConfig config;
    config.operatorModule = GENETICCARS_FAILING_MODULE_PATH;

    auto created = GenerationManager::create(config, 42);
    ASSERT_TRUE(created.isValue());
    auto& manager = *created.value();

    for (IndividualId id = 0; id < 20; ++id) {
        ASSERT_TRUE(manager.reportFitness(id, 1.0).isValue());
    }
    auto advanced = manager.advance();

    ASSERT_TRUE(advanced.isValue());
    // Every bred child fails once per role: 20 - 2 clones - 2 random.
    EXPECT_EQ(advanced.value().crossoverFailures, 16);
    EXPECT_EQ(advanced.value().mutationFailures, 16);
    EXPECT_EQ(manager.currentPopulation().size(), 20u);
}
