#include "OperatorRegistry.h"

#include "EvolutionConfig.h"
#include "OperatorModule.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>

namespace GeneticCars {

void OperatorRegistry::registerCrossover(const std::string& name, CrossoverFactory factory)
{
    GENETICCARS_ASSERT(!name.empty(), "OperatorRegistry: crossover name must not be empty");
    GENETICCARS_ASSERT(factory, "OperatorRegistry: crossover factory must be set");
    crossovers_[name] = std::move(factory);
}

void OperatorRegistry::registerMutation(const std::string& name, MutationFactory factory)
{
    GENETICCARS_ASSERT(!name.empty(), "OperatorRegistry: mutation name must not be empty");
    GENETICCARS_ASSERT(factory, "OperatorRegistry: mutation factory must be set");
    mutations_[name] = std::move(factory);
}

std::shared_ptr<const CrossoverOperator> OperatorRegistry::findCrossover(
    const std::string& name) const
{
    auto it = crossovers_.find(name);
    if (it == crossovers_.end()) {
        return nullptr;
    }
    return it->second();
}

std::shared_ptr<const MutationOperator> OperatorRegistry::findMutation(
    const std::string& name) const
{
    auto it = mutations_.find(name);
    if (it == mutations_.end()) {
        return nullptr;
    }
    return it->second();
}

std::vector<std::string> OperatorRegistry::crossoverNames() const
{
    std::vector<std::string> names;
    for (const auto& [name, factory] : crossovers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> OperatorRegistry::mutationNames() const
{
    std::vector<std::string> names;
    for (const auto& [name, factory] : mutations_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

Result<OperatorSet, EvolutionError> OperatorRegistry::bind(const EvolutionConfig& config) const
{
    using R = Result<OperatorSet, EvolutionError>;

    OperatorSet set;
    set.builtInCrossover = findCrossover(config.crossoverOperator);
    if (!set.builtInCrossover) {
        return R::error(
            EvolutionError::configuration(
                "Unknown crossover operator '" + config.crossoverOperator + "'"));
    }
    set.builtInMutation = findMutation(config.mutationOperator);
    if (!set.builtInMutation) {
        return R::error(
            EvolutionError::configuration(
                "Unknown mutation operator '" + config.mutationOperator + "'"));
    }
    set.crossover = set.builtInCrossover;
    set.mutation = set.builtInMutation;

    if (!config.operatorModule.has_value()) {
        LOG_INFO(
            Operators,
            "Using built-in operators: crossover {}, mutation {}",
            set.crossover->name(),
            set.mutation->name());
        return R::okay(std::move(set));
    }

    auto moduleResult = OperatorModule::load(*config.operatorModule);
    if (moduleResult.isError()) {
        LOG_WARN(
            Operators,
            "{}; falling back to built-ins {} and {}",
            moduleResult.errorValue().message,
            set.builtInCrossover->name(),
            set.builtInMutation->name());
        set.warnings.push_back(moduleResult.errorValue());
        return R::okay(std::move(set));
    }
    set.module = moduleResult.value();

    auto crossoverResult = set.module->crossoverOperator();
    if (crossoverResult.isValue()) {
        set.crossover = crossoverResult.value();
    }
    else {
        LOG_WARN(
            Operators,
            "{}; falling back to {}",
            crossoverResult.errorValue().message,
            set.builtInCrossover->name());
        set.warnings.push_back(crossoverResult.errorValue());
    }

    auto mutationResult = set.module->mutationOperator();
    if (mutationResult.isValue()) {
        set.mutation = mutationResult.value();
    }
    else {
        LOG_WARN(
            Operators,
            "{}; falling back to {}",
            mutationResult.errorValue().message,
            set.builtInMutation->name());
        set.warnings.push_back(mutationResult.errorValue());
    }

    LOG_INFO(
        Operators,
        "Bound operators: crossover {}, mutation {}",
        set.crossover->name(),
        set.mutation->name());
    return R::okay(std::move(set));
}

OperatorRegistry OperatorRegistry::createDefault()
{
    OperatorRegistry registry;

    // Built-ins are stateless, so every lookup can share one instance.
    auto point = std::make_shared<const PointCrossover>();
    auto uniform = std::make_shared<const UniformCrossover>();
    auto bitFlip = std::make_shared<const BitFlipMutation>();

    registry.registerCrossover(OperatorName::PointCrossover, [point] { return point; });
    registry.registerCrossover(OperatorName::UniformCrossover, [uniform] { return uniform; });
    registry.registerMutation(OperatorName::BitFlip, [bitFlip] { return bitFlip; });

    return registry;
}

} // namespace GeneticCars
