#pragma once

#include "EvolutionError.h"
#include "GeneticOperators.h"
#include "core/Result.h"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace GeneticCars {

struct EvolutionConfig;
class OperatorModule;

/**
 * Operators chosen for a run.
 *
 * `crossover` and `mutation` are what the manager calls first; the `builtIn*` pair is the
 * registry operator named in the config and is used to retry a failed breeding attempt.
 * When no module is configured both pairs are the same objects.
 */
struct OperatorSet {
    std::shared_ptr<const CrossoverOperator> crossover;
    std::shared_ptr<const MutationOperator> mutation;
    std::shared_ptr<const CrossoverOperator> builtInCrossover;
    std::shared_ptr<const MutationOperator> builtInMutation;

    // Keeps a loaded module mapped for the lifetime of the set.
    std::shared_ptr<OperatorModule> module;

    // Non-fatal binding problems: a module that failed to open or is missing a symbol.
    std::vector<EvolutionError> warnings;
};

class OperatorRegistry {
public:
    using CrossoverFactory = std::function<std::shared_ptr<const CrossoverOperator>()>;
    using MutationFactory = std::function<std::shared_ptr<const MutationOperator>()>;

    void registerCrossover(const std::string& name, CrossoverFactory factory);
    void registerMutation(const std::string& name, MutationFactory factory);

    std::shared_ptr<const CrossoverOperator> findCrossover(const std::string& name) const;
    std::shared_ptr<const MutationOperator> findMutation(const std::string& name) const;

    std::vector<std::string> crossoverNames() const;
    std::vector<std::string> mutationNames() const;

    // Resolves the config's operator names and optional module. Unknown names are
    // ConfigurationErrors. A module that fails to open or misses a symbol only warns, and
    // the affected roles keep their built-ins.
    Result<OperatorSet, EvolutionError> bind(const EvolutionConfig& config) const;

    static OperatorRegistry createDefault();

private:
    std::unordered_map<std::string, CrossoverFactory> crossovers_;
    std::unordered_map<std::string, MutationFactory> mutations_;
};

} // namespace GeneticCars
